#pragma once

// docsync/version.hpp — Explicit version manifest for every artifact surface.
//
// PURPOSE:
//   Prevent silent format drift in evidence packs. Every component that reads
//   or writes a versioned format checks its constant here before touching data.
//
// INVARIANT:
//   All version constants are compile-time. A pack pins the chain algorithm it
//   was built with; verify() selects the algorithm from the pinned value and
//   never assumes compatibility between versions.

#include <cstdint>
#include <string>

namespace docsync {
namespace version {

// ---------------------------------------------------------------------------
// Envelope format versions.
// "0.2.0" = per-item envelope + immutability proof + legacy flat view.
// "0.2.1" = same, plus a sanitization summary.
// Adding or removing a required envelope key requires a bump.
// ---------------------------------------------------------------------------
inline constexpr const char* PACK_FORMAT_VERSION = "0.2.0";
inline constexpr const char* PACK_FORMAT_VERSION_SANITIZED = "0.2.1";

// ---------------------------------------------------------------------------
// CHAIN_ALGORITHM_VERSION
// Version 2 = current: genesis sentinel, link over
//   (sequence | item_id | content_type | content_hash | previous_hash),
//   root = H(concat(chain_hash...)).
// Version 1 = legacy flat packs: link = H(prev + "|" + legacy_json(result)),
//   first prev = manifest_hash, no root. Verify-only, never produced.
// ---------------------------------------------------------------------------
inline constexpr uint32_t CHAIN_ALGORITHM_VERSION = 2;
inline constexpr uint32_t LEGACY_CHAIN_ALGORITHM_VERSION = 1;

inline constexpr const char* GENESIS_SENTINEL = "genesis";
inline constexpr const char* CLAIM_CONTENT_TYPE = "docsync/claim-result";

inline constexpr const char* RUNNER_NAME = "rlm-docsync";
inline constexpr const char* RUNNER_SEMVER = "0.2.1";

// ---------------------------------------------------------------------------
// Structured version manifest (runtime-accessible)
// ---------------------------------------------------------------------------
struct VersionManifest {
  std::string runner{RUNNER_NAME};
  std::string runner_semver{RUNNER_SEMVER};
  std::string pack_format{PACK_FORMAT_VERSION};
  std::string pack_format_sanitized{PACK_FORMAT_VERSION_SANITIZED};
  uint32_t chain_algorithm{CHAIN_ALGORITHM_VERSION};
  std::string default_hash_primitive;  // e.g. "sha256"
  std::string blake3_version;          // from blake3_version()
  std::string build_timestamp;         // __DATE__ "T" __TIME__
};

VersionManifest current_manifest();

// Serialize to compact JSON.
std::string manifest_to_json(const VersionManifest& m);

// Returns true if this build can verify packs pinned to chain_version.
bool supports_chain_algorithm(uint32_t chain_version);

}  // namespace version
}  // namespace docsync
