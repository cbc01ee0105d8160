#include "docsync/manifest.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>

#include "docsync/errors.hpp"

namespace docsync {

namespace {

// Optional string field: absent keeps the default, non-string is an error.
void read_string(const jsonlite::Object& obj, const std::string& key, std::string* out,
                 const std::string& where, std::vector<std::string>* errors) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) return;
  if (!v->is_string()) {
    errors->push_back(where + ": '" + key + "' must be a string");
    return;
  }
  *out = std::get<std::string>(v->v);
}

const jsonlite::Array* read_array(const jsonlite::Object& obj, const std::string& key,
                                  const std::string& where, std::vector<std::string>* errors) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v || v->is_null()) return nullptr;
  if (!v->is_array()) {
    errors->push_back(where + ": '" + key + "' must be an array");
    return nullptr;
  }
  return &std::get<jsonlite::Array>(v->v);
}

EvidenceSpec evidence_from_value(const jsonlite::Object& obj, const std::string& where,
                                 std::vector<std::string>* errors) {
  EvidenceSpec spec;
  read_string(obj, "type", &spec.type, where, errors);
  read_string(obj, "pattern", &spec.pattern, where, errors);
  read_string(obj, "scope", &spec.scope, where, errors);
  return spec;
}

ClaimEntry claim_from_value(const jsonlite::Object& obj, const std::string& where,
                            std::vector<std::string>* errors) {
  ClaimEntry claim;
  read_string(obj, "id", &claim.id, where, errors);
  read_string(obj, "text", &claim.text, where, errors);
  if (const auto* evidence = read_array(obj, "evidence", where, errors)) {
    for (std::size_t i = 0; i < evidence->size(); ++i) {
      const std::string ewhere = where + " evidence[" + std::to_string(i) + "]";
      if (!(*evidence)[i].is_object()) {
        errors->push_back(ewhere + ": must be an object");
        continue;
      }
      claim.evidence.push_back(
          evidence_from_value(std::get<jsonlite::Object>((*evidence)[i].v), ewhere, errors));
    }
  }
  return claim;
}

DocEntry doc_from_value(const jsonlite::Object& obj, const std::string& where,
                        std::vector<std::string>* errors) {
  DocEntry doc;
  read_string(obj, "path", &doc.path, where, errors);
  read_string(obj, "mode", &doc.mode, where, errors);
  if (const auto* claims = read_array(obj, "claims", where, errors)) {
    for (std::size_t i = 0; i < claims->size(); ++i) {
      const std::string cwhere = where + " claims[" + std::to_string(i) + "]";
      if (!(*claims)[i].is_object()) {
        errors->push_back(cwhere + ": must be an object");
        continue;
      }
      doc.claims.push_back(
          claim_from_value(std::get<jsonlite::Object>((*claims)[i].v), cwhere, errors));
    }
  }
  return doc;
}

}  // namespace

DocManifest manifest_from_value(const jsonlite::Object& root, std::vector<std::string>* errors) {
  DocManifest m;
  read_string(root, "version", &m.version, "manifest", errors);
  if (const auto* docs = read_array(root, "docs", "manifest", errors)) {
    for (std::size_t i = 0; i < docs->size(); ++i) {
      const std::string where = "manifest docs[" + std::to_string(i) + "]";
      if (!(*docs)[i].is_object()) {
        errors->push_back(where + ": must be an object");
        continue;
      }
      m.docs.push_back(doc_from_value(std::get<jsonlite::Object>((*docs)[i].v), where, errors));
    }
  }
  return m;
}

std::vector<std::string> validate_manifest(const DocManifest& manifest) {
  static const std::set<std::string> kModes = {"spec-first", "reality-first"};
  static const std::set<std::string> kEvidenceTypes = {"code", "markdown"};

  std::vector<std::string> errors;
  if (manifest.version.empty()) errors.push_back("manifest.version is required");
  if (manifest.docs.empty()) errors.push_back("manifest.docs must contain at least one entry");

  std::set<std::string> seen_ids;
  for (const auto& doc : manifest.docs) {
    if (doc.path.empty()) errors.push_back("doc entry missing 'path'");
    if (!kModes.contains(doc.mode)) {
      errors.push_back("doc '" + doc.path +
                       "': mode must be 'spec-first' or 'reality-first', got '" + doc.mode + "'");
    }
    for (const auto& claim : doc.claims) {
      if (claim.id.empty()) {
        errors.push_back("doc '" + doc.path + "': claim missing 'id'");
      } else if (!seen_ids.insert(claim.id).second) {
        errors.push_back("duplicate claim id: " + claim.id);
      }
      if (claim.text.empty()) {
        errors.push_back("doc '" + doc.path + "': claim '" + claim.id + "' missing 'text'");
      }
      for (const auto& spec : claim.evidence) {
        if (!kEvidenceTypes.contains(spec.type)) {
          errors.push_back("claim '" + claim.id + "': unknown evidence type '" + spec.type + "'");
        }
      }
    }
  }
  return errors;
}

DocManifest parse_manifest(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Value root = jsonlite::parse_value(text, &err);
  if (err) throw ValidationError({"manifest must be valid JSON: " + err->message});
  if (!root.is_object()) throw ValidationError({"manifest root must be an object"});

  std::vector<std::string> errors;
  DocManifest m = manifest_from_value(std::get<jsonlite::Object>(root.v), &errors);
  for (auto& e : validate_manifest(m)) errors.push_back(std::move(e));
  if (!errors.empty()) throw ValidationError(std::move(errors));
  return m;
}

DocManifest load_manifest_file(const std::string& path, std::string* raw_text) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ValidationError({"manifest not found: " + path}, ErrorCode::manifest_not_found);
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw ValidationError({"manifest not readable: " + path}, ErrorCode::manifest_not_found);
  std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  DocManifest m = parse_manifest(text);
  if (raw_text) *raw_text = std::move(text);
  return m;
}

}  // namespace docsync
