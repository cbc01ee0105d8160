#include "docsync/version.hpp"

#include "docsync/hash.hpp"
#include "docsync/jsonlite.hpp"

namespace docsync {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.default_hash_primitive = to_string(HashAlgorithm::sha256);
  m.blake3_version = blake3_library_version();
  // Build timestamp from preprocessor macros; fixed within a single build.
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o;
  o["runner"] = m.runner;
  o["runner_semver"] = m.runner_semver;
  o["pack_format"] = m.pack_format;
  o["pack_format_sanitized"] = m.pack_format_sanitized;
  o["chain_algorithm"] = static_cast<uint64_t>(m.chain_algorithm);
  o["default_hash_primitive"] = m.default_hash_primitive;
  o["blake3_version"] = m.blake3_version;
  o["build_timestamp"] = m.build_timestamp;
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

bool supports_chain_algorithm(uint32_t chain_version) {
  return chain_version == CHAIN_ALGORITHM_VERSION ||
         chain_version == LEGACY_CHAIN_ALGORITHM_VERSION;
}

}  // namespace version
}  // namespace docsync
