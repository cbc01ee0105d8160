#pragma once

// docsync/config.hpp — Run configuration.
//
// Configuration is a plain value passed explicitly into the runner, the
// sanitization coordinator and the redaction client. Nothing is cached in
// globals. Precedence: built-in defaults < environment (apply_env) < CLI flags.
//
// Environment variables:
//   DOCSYNC_PII_SHIELD_ENDPOINT      redaction service URL
//   DOCSYNC_PII_SHIELD_API_KEY       bearer token
//   DOCSYNC_PII_SHIELD_TIMEOUT_MS    request timeout (default 5000)
//   DOCSYNC_PII_SHIELD_FAIL_CLOSED   "1"/"true"/"yes"/"on" aborts on failure
//   DOCSYNC_SALT_FINGERPRINT         redaction salt label or sha256 fingerprint
//   DOCSYNC_HASH_ALGORITHM           "sha256" (default) | "blake3"
//   DOCSYNC_MAX_WORKERS              concurrent documents (default 4)

#include <cstdint>
#include <string>
#include <vector>

#include "docsync/hash.hpp"

namespace docsync {

struct SanitizerConfig {
  std::string endpoint;
  std::string api_key;
  uint32_t timeout_ms{5000};
  bool fail_closed{false};
  std::string salt_label;
  bool include_findings{false};
  std::string purpose{"docsync_pack"};

  bool enabled() const { return !endpoint.empty() || fail_closed; }
};

struct RunnerConfig {
  std::string repo_root{"."};
  std::string output_dir{"."};
  HashAlgorithm hash_algorithm{HashAlgorithm::sha256};
  uint32_t max_workers{4};
  bool parallel_evidence{false};
  SanitizerConfig sanitizer;
};

// Overlay DOCSYNC_* environment variables. Malformed values are left at their
// current setting and reported in the returned list.
std::vector<std::string> apply_env(RunnerConfig& config);

// "1", "true", "yes", "on" (case-insensitive) are true.
bool parse_bool_flag(const std::string& text);

}  // namespace docsync
