#include "docsync/chain.hpp"

#include <stdexcept>
#include <utility>

#include "docsync/claims.hpp"
#include "docsync/jsonlite.hpp"
#include "docsync/version.hpp"

namespace docsync {

namespace {

VerifyResult failure(ErrorCode code, std::string reason, std::optional<std::size_t> index = {},
                     std::string expected = "", std::string actual = "") {
  VerifyResult r;
  r.ok = false;
  r.code = code;
  r.reason = std::move(reason);
  r.index = index;
  r.expected = std::move(expected);
  r.actual = std::move(actual);
  return r;
}

VerifyResult mismatch(const char* what, std::size_t i, const std::string& expected,
                      const std::string& actual) {
  return failure(ErrorCode::chain_integrity_error,
                 std::string(what) + " at index " + std::to_string(i) + ": expected " + expected +
                     ", got " + actual,
                 i, expected, actual);
}

VerifyResult length_mismatch(std::size_t chain_len, std::size_t results_len) {
  return failure(ErrorCode::chain_integrity_error,
                 "chain length (" + std::to_string(chain_len) + ") != results length (" +
                     std::to_string(results_len) + ")");
}

VerifyResult verify_legacy(const EvidencePack& pack) {
  if (pack.hash_chain.size() != pack.results.size())
    return length_mismatch(pack.hash_chain.size(), pack.results.size());
  const auto expected = ChainBuilder::legacy_chain(pack.manifest_hash, pack.results);
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (pack.hash_chain[i] != expected[i])
      return mismatch("hash mismatch", i, expected[i], pack.hash_chain[i]);
  }
  return VerifyResult{};
}

VerifyResult verify_current(const EvidencePack& pack) {
  if (pack.chain.size() != pack.results.size())
    return length_mismatch(pack.chain.size(), pack.results.size());

  const ChainBuildResult expected = ChainBuilder(pack.hash_algorithm).build(pack.results);

  for (std::size_t i = 0; i < expected.chain.size(); ++i) {
    const ChainLink& want = expected.chain[i];
    const ChainLink& got = pack.chain[i];
    if (got.chain_hash != want.chain_hash)
      return mismatch("hash mismatch", i, want.chain_hash, got.chain_hash);
    if (got.content_hash != want.content_hash)
      return mismatch("content hash mismatch", i, want.content_hash, got.content_hash);
    if (got.previous_hash != want.previous_hash)
      return mismatch("previous hash mismatch", i, want.previous_hash, got.previous_hash);
    if (got.sequence != want.sequence || got.item_id != want.item_id ||
        got.content_type != want.content_type) {
      return mismatch("link metadata mismatch", i, want.item_id, got.item_id);
    }
  }

  // The flat view must describe the same links.
  if (pack.hash_chain.size() != pack.chain.size()) {
    return failure(ErrorCode::chain_integrity_error,
                   "flat hash_chain length (" + std::to_string(pack.hash_chain.size()) +
                       ") != chain length (" + std::to_string(pack.chain.size()) + ")");
  }
  for (std::size_t i = 0; i < pack.hash_chain.size(); ++i) {
    if (pack.hash_chain[i] != pack.chain[i].chain_hash)
      return mismatch("flat hash_chain mismatch", i, pack.chain[i].chain_hash, pack.hash_chain[i]);
  }

  if (pack.root_hash.empty()) {
    return failure(ErrorCode::chain_integrity_error,
                   "root hash missing: expected " + expected.root_hash, std::nullopt,
                   expected.root_hash, "");
  }
  if (pack.root_hash != expected.root_hash) {
    return failure(ErrorCode::chain_integrity_error,
                   "root hash mismatch: expected " + expected.root_hash + ", got " + pack.root_hash,
                   std::nullopt, expected.root_hash, pack.root_hash);
  }
  return VerifyResult{};
}

}  // namespace

std::string ChainBuilder::item_id_for(uint64_t sequence) {
  return "claim-" + std::to_string(sequence);
}

std::string ChainBuilder::link_hash(HashAlgorithm algorithm, uint64_t sequence,
                                    const std::string& item_id, const std::string& content_type,
                                    const std::string& content_hash,
                                    const std::string& previous_hash) {
  std::string payload;
  payload.reserve(32 + item_id.size() + content_type.size() + content_hash.size() +
                  previous_hash.size());
  payload += std::to_string(sequence);
  payload += '|';
  payload += item_id;
  payload += '|';
  payload += content_type;
  payload += '|';
  payload += content_hash;
  payload += '|';
  payload += previous_hash;
  return hash_text(algorithm, payload);
}

ChainBuildResult ChainBuilder::build(const std::vector<ClaimResult>& results) const {
  ChainBuildResult out;
  out.chain.reserve(results.size());
  std::string prev = version::GENESIS_SENTINEL;
  std::string concatenated;
  concatenated.reserve(results.size() * 72);
  for (std::size_t i = 0; i < results.size(); ++i) {
    ChainLink link;
    link.sequence = static_cast<uint64_t>(i);
    link.item_id = item_id_for(link.sequence);
    link.content_type = version::CLAIM_CONTENT_TYPE;
    link.content_hash = hash_text(algorithm_, canonical_claim_json(results[i]));
    link.previous_hash = prev;
    link.chain_hash = link_hash(algorithm_, link.sequence, link.item_id, link.content_type,
                                link.content_hash, link.previous_hash);
    prev = link.chain_hash;
    concatenated += link.chain_hash;
    out.chain.push_back(std::move(link));
  }
  out.root_hash = hash_text(algorithm_, concatenated);
  return out;
}

std::shared_ptr<const EvidencePack> ChainBuilder::freeze(EvidencePack pack) const {
  if (pack.frozen()) throw std::logic_error("evidence pack is already frozen");
  ChainBuildResult built = build(pack.results);
  pack.hash_chain.clear();
  pack.hash_chain.reserve(built.chain.size());
  for (const auto& link : built.chain) pack.hash_chain.push_back(link.chain_hash);
  pack.chain = std::move(built.chain);
  pack.root_hash = std::move(built.root_hash);
  pack.hash_algorithm = algorithm_;
  pack.chain_algorithm_version = version::CHAIN_ALGORITHM_VERSION;
  return std::make_shared<const EvidencePack>(std::move(pack));
}

std::vector<std::string> ChainBuilder::legacy_chain(const std::string& manifest_hash,
                                                    const std::vector<ClaimResult>& results) {
  std::vector<std::string> chain;
  chain.reserve(results.size());
  std::string prev = manifest_hash;
  for (const auto& r : results) {
    std::string link =
        hash_text(HashAlgorithm::sha256, prev + "|" + jsonlite::to_json_legacy(claim_result_to_value(r)));
    prev = link;
    chain.push_back(std::move(link));
  }
  return chain;
}

VerifyResult ChainBuilder::verify(const EvidencePack& pack) {
  switch (pack.chain_algorithm_version) {
    case version::CHAIN_ALGORITHM_VERSION:
      return verify_current(pack);
    case version::LEGACY_CHAIN_ALGORITHM_VERSION:
      return verify_legacy(pack);
    case 0:
      return failure(ErrorCode::chain_integrity_error, "pack has no integrity proof");
    default:
      return failure(ErrorCode::structural_decode_error,
                     "unsupported chain algorithm version " +
                         std::to_string(pack.chain_algorithm_version));
  }
}

void ChainBuilder::require_verified(const EvidencePack& pack) {
  const VerifyResult r = verify(pack);
  if (r.ok) return;
  throw ChainIntegrityError(r.reason, r.index.value_or(0), r.expected, r.actual);
}

}  // namespace docsync
