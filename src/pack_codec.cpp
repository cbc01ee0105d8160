#include "docsync/pack_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "docsync/chain.hpp"
#include "docsync/claims.hpp"
#include "docsync/errors.hpp"
#include "docsync/hash.hpp"
#include "docsync/version.hpp"

namespace fs = std::filesystem;

namespace docsync {

namespace {

const jsonlite::Object& as_object(const jsonlite::Value& v, const std::string& what) {
  if (!v.is_object()) throw StructuralDecodeError(what + " must be an object");
  return std::get<jsonlite::Object>(v.v);
}

const jsonlite::Array& as_array(const jsonlite::Value& v, const std::string& what) {
  if (!v.is_array()) throw StructuralDecodeError(what + " must be an array");
  return std::get<jsonlite::Array>(v.v);
}

const std::string& req_string(const jsonlite::Object& obj, const std::string& key,
                              const std::string& what) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) throw StructuralDecodeError(what + " is missing required key '" + key + "'");
  if (!v->is_string()) throw StructuralDecodeError(what + " key '" + key + "' must be a string");
  return std::get<std::string>(v->v);
}

std::string opt_string(const jsonlite::Object& obj, const std::string& key, const std::string& def,
                       const std::string& what) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) return def;
  if (!v->is_string()) throw StructuralDecodeError(what + " key '" + key + "' must be a string");
  return std::get<std::string>(v->v);
}

uint64_t req_u64(const jsonlite::Object& obj, const std::string& key, const std::string& what) {
  const jsonlite::Value* v = jsonlite::find(obj, key);
  if (!v) throw StructuralDecodeError(what + " is missing required key '" + key + "'");
  if (!v->is_u64())
    throw StructuralDecodeError(what + " key '" + key + "' must be a non-negative integer");
  return std::get<std::uint64_t>(v->v);
}

jsonlite::Value link_to_value(const ChainLink& link) {
  jsonlite::Object o;
  o["sequence"] = link.sequence;
  o["item_id"] = link.item_id;
  o["content_type"] = link.content_type;
  o["content_hash"] = link.content_hash;
  o["previous_hash"] = link.previous_hash;
  o["chain_hash"] = link.chain_hash;
  return o;
}

ChainLink decode_link(const jsonlite::Value& value, std::size_t i) {
  const std::string what = "immutability_proof.hash_chain[" + std::to_string(i) + "]";
  const auto& obj = as_object(value, what);
  ChainLink link;
  link.sequence = req_u64(obj, "sequence", what);
  link.item_id = req_string(obj, "item_id", what);
  link.content_type = req_string(obj, "content_type", what);
  link.content_hash = req_string(obj, "content_hash", what);
  link.previous_hash = req_string(obj, "previous_hash", what);
  link.chain_hash = req_string(obj, "chain_hash", what);
  return link;
}

std::vector<ClaimResult> decode_results(const jsonlite::Array& arr) {
  std::vector<ClaimResult> out;
  out.reserve(arr.size());
  for (const auto& v : arr) out.push_back(decode_claim_result(v));
  return out;
}

struct DecodedItem {
  uint64_t sequence{0};
  std::string item_id;
  std::string content_type;
  std::string content_hash;
  ClaimResult content;
};

std::vector<DecodedItem> decode_items(const jsonlite::Array& arr) {
  std::vector<DecodedItem> out;
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string what = "items[" + std::to_string(i) + "]";
    const auto& obj = as_object(arr[i], what);
    const jsonlite::Value* content = jsonlite::find(obj, "content");
    if (!content) throw StructuralDecodeError(what + " is missing required key 'content'");
    DecodedItem item;
    item.sequence = req_u64(obj, "sequence", what);
    item.item_id = req_string(obj, "item_id", what);
    item.content_type = req_string(obj, "content_type", what);
    item.content_hash = req_string(obj, "content_hash", what);
    item.content = decode_claim_result(*content);
    out.push_back(std::move(item));
  }
  return out;
}

// The per-item view must restate the results and the proof exactly.
void check_items(const std::vector<DecodedItem>& items, const EvidencePack& pack) {
  if (items.size() != pack.results.size()) {
    throw StructuralDecodeError("items length (" + std::to_string(items.size()) +
                                ") != results length (" + std::to_string(pack.results.size()) +
                                ")");
  }
  for (std::size_t i = 0; i < items.size(); ++i) {
    const std::string what = "items[" + std::to_string(i) + "]";
    const DecodedItem& item = items[i];
    if (item.content != pack.results[i])
      throw StructuralDecodeError(what + " content disagrees with results[" + std::to_string(i) +
                                  "]");
    if (i >= pack.chain.size()) continue;
    const ChainLink& link = pack.chain[i];
    if (item.sequence != link.sequence || item.item_id != link.item_id ||
        item.content_type != link.content_type || item.content_hash != link.content_hash) {
      throw StructuralDecodeError(what + " disagrees with immutability_proof.hash_chain[" +
                                  std::to_string(i) + "]");
    }
  }
}

std::vector<std::string> decode_flat_chain(const jsonlite::Value& value) {
  std::vector<std::string> out;
  const auto& arr = as_array(value, "hash_chain");
  out.reserve(arr.size());
  for (const auto& v : arr) {
    if (!v.is_string()) throw StructuralDecodeError("hash_chain entries must be strings");
    out.push_back(std::get<std::string>(v.v));
  }
  return out;
}

void decode_proof(const jsonlite::Value& value, EvidencePack* pack) {
  const auto& proof = as_object(value, "immutability_proof");

  const std::string alg_name = opt_string(proof, "hash_algorithm", "sha256", "immutability_proof");
  const auto alg = parse_hash_algorithm(alg_name);
  if (!alg) throw StructuralDecodeError("unknown hash algorithm '" + alg_name + "'");
  pack->hash_algorithm = *alg;

  uint64_t chain_version = version::CHAIN_ALGORITHM_VERSION;
  if (jsonlite::find(proof, "chain_algorithm_version"))
    chain_version = req_u64(proof, "chain_algorithm_version", "immutability_proof");
  if (chain_version > UINT32_MAX ||
      !version::supports_chain_algorithm(static_cast<uint32_t>(chain_version))) {
    throw StructuralDecodeError("unsupported chain algorithm version " +
                                std::to_string(chain_version));
  }
  pack->chain_algorithm_version = static_cast<uint32_t>(chain_version);

  const jsonlite::Value* links = jsonlite::find(proof, "hash_chain");
  if (!links) throw StructuralDecodeError("immutability_proof is missing required key 'hash_chain'");
  const auto& arr = as_array(*links, "immutability_proof.hash_chain");
  pack->chain.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) pack->chain.push_back(decode_link(arr[i], i));

  pack->root_hash = opt_string(proof, "root_hash", "", "immutability_proof");
}

}  // namespace

// ---------------------------------------------------------------------------
// SanitizationSummary
// ---------------------------------------------------------------------------

jsonlite::Value sanitization_summary_to_value(const SanitizationSummary& s) {
  jsonlite::Object by_type;
  for (const auto& [type, count] : s.redactions_by_type) by_type[type] = count;
  jsonlite::Array applied;
  for (const auto& stage : s.applied_to) applied.emplace_back(stage);

  jsonlite::Object o;
  o["engine_name"] = s.engine_name;
  o["engine_version"] = s.engine_version;
  o["method"] = to_string(s.method);
  o["token_format"] = s.token_format;
  o["salt_fingerprint"] = s.salt_fingerprint;
  o["redaction_count"] = s.redaction_count;
  o["redactions_by_type"] = std::move(by_type);
  o["input_hash"] = s.input_hash;
  o["output_hash"] = s.output_hash;
  o["applied_to"] = std::move(applied);
  o["status"] = to_string(s.status);
  return o;
}

SanitizationSummary decode_sanitization_summary(const jsonlite::Value& value) {
  const std::string what = "sanitization";
  const auto& obj = as_object(value, what);
  SanitizationSummary s;
  s.engine_name = opt_string(obj, "engine_name", s.engine_name, what);
  s.engine_version = opt_string(obj, "engine_version", s.engine_version, what);
  s.token_format = opt_string(obj, "token_format", "", what);
  s.salt_fingerprint = opt_string(obj, "salt_fingerprint", "", what);
  s.input_hash = opt_string(obj, "input_hash", "", what);
  s.output_hash = opt_string(obj, "output_hash", "", what);

  const std::string method = opt_string(obj, "method", to_string(s.method), what);
  const auto parsed_method = parse_redaction_method(method);
  if (!parsed_method) throw StructuralDecodeError("sanitization has unknown method '" + method + "'");
  s.method = *parsed_method;

  const std::string status = opt_string(obj, "status", to_string(s.status), what);
  const auto parsed_status = parse_sanitization_status(status);
  if (!parsed_status) throw StructuralDecodeError("sanitization has unknown status '" + status + "'");
  s.status = *parsed_status;

  if (jsonlite::find(obj, "redaction_count")) s.redaction_count = req_u64(obj, "redaction_count", what);

  if (const auto* by_type = jsonlite::find(obj, "redactions_by_type")) {
    for (const auto& [type, count] : as_object(*by_type, "sanitization.redactions_by_type")) {
      if (!count.is_u64())
        throw StructuralDecodeError("sanitization.redactions_by_type values must be non-negative integers");
      s.redactions_by_type[type] = std::get<std::uint64_t>(count.v);
    }
  }
  if (const auto* applied = jsonlite::find(obj, "applied_to")) {
    for (const auto& stage : as_array(*applied, "sanitization.applied_to")) {
      if (!stage.is_string()) throw StructuralDecodeError("sanitization.applied_to entries must be strings");
      s.applied_to.insert(std::get<std::string>(stage.v));
    }
  }
  return s;
}

// ---------------------------------------------------------------------------
// Envelope
// ---------------------------------------------------------------------------

jsonlite::Value pack_to_value(const EvidencePack& pack) {
  if (!pack.frozen()) throw std::logic_error("cannot serialize an evidence pack before it is frozen");

  jsonlite::Array items;
  jsonlite::Array results;
  items.reserve(pack.results.size());
  results.reserve(pack.results.size());
  for (std::size_t i = 0; i < pack.results.size(); ++i) {
    jsonlite::Value content = claim_result_to_value(pack.results[i]);
    jsonlite::Object item;
    item["item_id"] = ChainBuilder::item_id_for(i);
    item["sequence"] = static_cast<uint64_t>(i);
    item["content_type"] = version::CLAIM_CONTENT_TYPE;
    item["content_hash"] = i < pack.chain.size()
                               ? pack.chain[i].content_hash
                               : hash_text(pack.hash_algorithm, jsonlite::to_json(content));
    item["content"] = content;
    items.push_back(std::move(item));
    results.push_back(std::move(content));
  }

  jsonlite::Array links;
  links.reserve(pack.chain.size());
  for (const auto& link : pack.chain) links.push_back(link_to_value(link));

  jsonlite::Object proof;
  proof["hash_chain"] = std::move(links);
  proof["root_hash"] = pack.root_hash;
  proof["hash_algorithm"] = to_string(pack.hash_algorithm);
  proof["chain_algorithm_version"] = static_cast<uint64_t>(pack.chain_algorithm_version);

  jsonlite::Array flat;
  flat.reserve(pack.hash_chain.size());
  for (const auto& h : pack.hash_chain) flat.emplace_back(h);

  jsonlite::Object o;
  o["version"] = pack.sanitization ? version::PACK_FORMAT_VERSION_SANITIZED
                                   : version::PACK_FORMAT_VERSION;
  o["manifest_hash"] = pack.manifest_hash;
  o["runner"] = pack.runner;
  o["runner_version"] = pack.runner_version;
  o["timestamp"] = pack.timestamp;
  o["items"] = std::move(items);
  o["immutability_proof"] = std::move(proof);
  o["results"] = std::move(results);
  o["hash_chain"] = std::move(flat);
  if (pack.sanitization) o["sanitization"] = sanitization_summary_to_value(*pack.sanitization);
  return o;
}

std::string serialize_pack(const EvidencePack& pack) {
  return jsonlite::to_json_pretty(pack_to_value(pack)) + "\n";
}

EvidencePack pack_from_value(const jsonlite::Value& value) {
  const auto& root = as_object(value, "evidence pack");

  EvidencePack pack;
  pack.manifest_hash = req_string(root, "manifest_hash", "evidence pack");
  pack.runner = opt_string(root, "runner", version::RUNNER_NAME, "evidence pack");
  pack.runner_version = opt_string(root, "runner_version", "0.1.0", "evidence pack");
  pack.timestamp = opt_string(root, "timestamp", "", "evidence pack");

  const jsonlite::Value* tag = jsonlite::find(root, "version");
  const jsonlite::Value* proof = jsonlite::find(root, "immutability_proof");
  if (tag) {
    if (!tag->is_string()) throw StructuralDecodeError("evidence pack key 'version' must be a string");
    const auto& v = std::get<std::string>(tag->v);
    if (v != version::PACK_FORMAT_VERSION && v != version::PACK_FORMAT_VERSION_SANITIZED)
      throw StructuralDecodeError("unsupported pack format version '" + v + "'");
    if (!proof) throw StructuralDecodeError("pack version " + v + " requires 'immutability_proof'");
  }

  if (const auto* results = jsonlite::find(root, "results"))
    pack.results = decode_results(as_array(*results, "results"));
  std::vector<DecodedItem> items;
  const jsonlite::Value* items_value = jsonlite::find(root, "items");
  if (items_value) items = decode_items(as_array(*items_value, "items"));
  if (pack.results.empty()) {
    for (const auto& item : items) pack.results.push_back(item.content);
  }

  if (proof) {
    decode_proof(*proof, &pack);
  } else {
    pack.hash_algorithm = HashAlgorithm::sha256;
    pack.chain_algorithm_version = version::LEGACY_CHAIN_ALGORITHM_VERSION;
  }
  if (items_value) check_items(items, pack);

  if (const auto* flat = jsonlite::find(root, "hash_chain")) {
    pack.hash_chain = decode_flat_chain(*flat);
  } else {
    for (const auto& link : pack.chain) pack.hash_chain.push_back(link.chain_hash);
  }

  if (const auto* summary = jsonlite::find(root, "sanitization"); summary && !summary->is_null())
    pack.sanitization = decode_sanitization_summary(*summary);
  return pack;
}

EvidencePack deserialize_pack(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Value root = jsonlite::parse_value(text, &err);
  if (err) throw StructuralDecodeError("evidence pack is not valid JSON: " + err->message);
  return pack_from_value(root);
}

EvidencePack load_pack_file(const std::string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    throw IoError("pack not found: " + path, ErrorCode::pack_not_found);
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw IoError("pack not readable: " + path, ErrorCode::pack_not_found);
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return deserialize_pack(text);
}

// Atomic write: tmp + rename on the same filesystem.
void write_pack_file(const std::string& path, const EvidencePack& pack) {
  const std::string text = serialize_pack(pack);
  const std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) throw IoError("cannot open for writing: " + tmp);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!ofs) throw IoError("write failed: " + tmp);
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw IoError("cannot move pack into place: " + path);
  }
}

}  // namespace docsync
