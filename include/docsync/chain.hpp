#pragma once

// docsync/chain.hpp — Tamper-evident hash chain over claim results.
//
// DESIGN INVARIANTS (must not be broken):
//   1. content_hash_i = H(canonical_json(result_i)). Canonicalization is total
//      and stable (see jsonlite::to_json), so the same logical result always
//      hashes identically.
//   2. chain_hash_i = H("<i>|claim-<i>|<content_type>|<content_hash_i>|<prev>")
//      where prev is "genesis" for i = 0 and chain_hash_(i-1) otherwise.
//   3. root_hash = H(chain_hash_0 + ... + chain_hash_(n-1)). Zero results give
//      an empty chain and root H(""). A version 2 pack without a root hash
//      does not verify.
//   4. verify() is pure. It recomputes everything from pack.results with the
//      hash algorithm and chain algorithm version pinned in the pack, and never
//      mutates or repairs the pack.
//   5. Once frozen, a pack is handed out as shared_ptr<const EvidencePack> and
//      is safe for any number of concurrent readers.
//
// CHAIN ALGORITHM VERSIONS:
//   2 = current (above). 1 = legacy flat packs, verify-only:
//   link_i = H(prev + "|" + legacy_json(result_i)), prev_0 = manifest_hash,
//   no root hash, always SHA-256.
//
// EXTENSION_POINT: chain_algorithm_upgrade
//   A new link formula gets a new version number here and in version.hpp.
//   verify() dispatches on the pinned value; old packs keep their algorithm.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docsync/errors.hpp"
#include "docsync/hash.hpp"
#include "docsync/types.hpp"

namespace docsync {

struct ChainBuildResult {
  std::vector<ChainLink> chain;
  std::string root_hash;
};

// Non-throwing verification outcome. reason is "ok" on success.
struct VerifyResult {
  bool ok{true};
  std::string reason{"ok"};
  ErrorCode code{ErrorCode::none};
  std::optional<std::size_t> index;  // first divergent index, if any
  std::string expected;
  std::string actual;
};

class ChainBuilder {
 public:
  explicit ChainBuilder(HashAlgorithm algorithm = HashAlgorithm::sha256)
      : algorithm_(algorithm) {}

  HashAlgorithm algorithm() const { return algorithm_; }

  ChainBuildResult build(const std::vector<ClaimResult>& results) const;

  // Builds the chain into the pack, pins algorithm and chain version, and
  // returns it read-only. Throws std::logic_error if the pack is already frozen.
  std::shared_ptr<const EvidencePack> freeze(EvidencePack pack) const;

  static VerifyResult verify(const EvidencePack& pack);

  // verify(), throwing ChainIntegrityError on failure.
  static void require_verified(const EvidencePack& pack);

  // Single link of the current algorithm.
  static std::string link_hash(HashAlgorithm algorithm, uint64_t sequence,
                               const std::string& item_id, const std::string& content_type,
                               const std::string& content_hash, const std::string& previous_hash);

  static std::string item_id_for(uint64_t sequence);

  // Legacy (version 1) flat chain, recomputed for verification only.
  static std::vector<std::string> legacy_chain(const std::string& manifest_hash,
                                               const std::vector<ClaimResult>& results);

 private:
  HashAlgorithm algorithm_;
};

}  // namespace docsync
