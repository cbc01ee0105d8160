#include "docsync/claims.hpp"

#include <initializer_list>

#include "docsync/errors.hpp"

namespace docsync {

namespace {

const std::string& require_string(const jsonlite::Object& obj, const std::string& key,
                                  const char* what) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) throw StructuralDecodeError(std::string(what) + " is missing required key '" + key + "'");
  if (!v->is_string())
    throw StructuralDecodeError(std::string(what) + " key '" + key + "' must be a string");
  return std::get<std::string>(v->v);
}

void reject_unknown_keys(const jsonlite::Object& obj, std::initializer_list<const char*> allowed,
                         const char* what) {
  for (const auto& [key, value] : obj) {
    bool known = false;
    for (const char* a : allowed) {
      if (key == a) {
        known = true;
        break;
      }
    }
    if (!known) throw StructuralDecodeError(std::string(what) + " has unknown key '" + key + "'");
  }
}

}  // namespace

jsonlite::Value evidence_ref_to_value(const EvidenceRef& ref) {
  jsonlite::Object o;
  o["source_type"] = ref.source_type;
  o["path"] = ref.path;
  o["line"] = ref.line;
  o["snippet"] = ref.snippet;
  o["matched"] = ref.matched;
  return o;
}

jsonlite::Value claim_result_to_value(const ClaimResult& result) {
  jsonlite::Array evidence;
  evidence.reserve(result.evidence.size());
  for (const auto& ref : result.evidence) evidence.push_back(evidence_ref_to_value(ref));

  jsonlite::Object o;
  o["claim_id"] = result.claim_id;
  o["claim_text"] = result.claim_text;
  o["status"] = to_string(result.status);
  o["evidence"] = std::move(evidence);
  o["message"] = result.message;
  return o;
}

std::string canonical_claim_json(const ClaimResult& result) {
  return jsonlite::to_json(claim_result_to_value(result));
}

std::string canonical_results_json(const std::vector<ClaimResult>& results) {
  jsonlite::Array arr;
  arr.reserve(results.size());
  for (const auto& r : results) arr.push_back(claim_result_to_value(r));
  return jsonlite::to_json(jsonlite::Value{std::move(arr)});
}

EvidenceRef decode_evidence_ref(const jsonlite::Value& value) {
  if (!value.is_object()) throw StructuralDecodeError("evidence entry must be an object");
  const auto& obj = std::get<jsonlite::Object>(value.v);
  reject_unknown_keys(obj, {"source_type", "path", "line", "snippet", "matched"}, "evidence entry");

  EvidenceRef ref;
  ref.source_type = require_string(obj, "source_type", "evidence entry");
  ref.path = require_string(obj, "path", "evidence entry");

  if (const auto* line = jsonlite::find(obj, "line")) {
    if (!line->is_u64())
      throw StructuralDecodeError("evidence entry key 'line' must be a non-negative integer");
    ref.line = std::get<std::uint64_t>(line->v);
  }
  if (const auto* snippet = jsonlite::find(obj, "snippet")) {
    if (!snippet->is_string())
      throw StructuralDecodeError("evidence entry key 'snippet' must be a string");
    ref.snippet = std::get<std::string>(snippet->v);
    if (utf8_length(ref.snippet) > kMaxSnippetLength)
      throw StructuralDecodeError("evidence entry snippet exceeds " +
                                  std::to_string(kMaxSnippetLength) + " code points");
  }
  if (const auto* matched = jsonlite::find(obj, "matched")) {
    if (!matched->is_bool())
      throw StructuralDecodeError("evidence entry key 'matched' must be a boolean");
    ref.matched = std::get<bool>(matched->v);
  }
  return ref;
}

ClaimResult decode_claim_result(const jsonlite::Value& value) {
  if (!value.is_object()) throw StructuralDecodeError("claim result must be an object");
  const auto& obj = std::get<jsonlite::Object>(value.v);
  reject_unknown_keys(obj, {"claim_id", "claim_text", "status", "evidence", "message"},
                      "claim result");

  ClaimResult r;
  r.claim_id = require_string(obj, "claim_id", "claim result");
  r.claim_text = require_string(obj, "claim_text", "claim result");

  if (const auto* status = jsonlite::find(obj, "status")) {
    if (!status->is_string())
      throw StructuralDecodeError("claim result key 'status' must be a string");
    const auto parsed = parse_claim_status(std::get<std::string>(status->v));
    if (!parsed)
      throw StructuralDecodeError("claim result has unknown status '" +
                                  std::get<std::string>(status->v) + "'");
    r.status = *parsed;
  }

  if (const auto* evidence = jsonlite::find(obj, "evidence")) {
    if (!evidence->is_array())
      throw StructuralDecodeError("claim result key 'evidence' must be an array");
    const auto& arr = std::get<jsonlite::Array>(evidence->v);
    r.evidence.reserve(arr.size());
    for (const auto& e : arr) r.evidence.push_back(decode_evidence_ref(e));
  }

  if (const auto* message = jsonlite::find(obj, "message")) {
    if (!message->is_string())
      throw StructuralDecodeError("claim result key 'message' must be a string");
    r.message = std::get<std::string>(message->v);
  }
  return r;
}

}  // namespace docsync
