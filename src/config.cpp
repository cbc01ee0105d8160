#include "docsync/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace docsync {

namespace {

const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

bool parse_u32(const std::string& text, uint32_t* out) {
  uint32_t v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || ptr != text.data() + text.size()) return false;
  *out = v;
  return true;
}

}  // namespace

bool parse_bool_flag(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::vector<std::string> apply_env(RunnerConfig& config) {
  std::vector<std::string> problems;

  if (const char* v = env_value("DOCSYNC_PII_SHIELD_ENDPOINT")) config.sanitizer.endpoint = v;
  if (const char* v = env_value("DOCSYNC_PII_SHIELD_API_KEY")) config.sanitizer.api_key = v;
  if (const char* v = env_value("DOCSYNC_PII_SHIELD_FAIL_CLOSED"))
    config.sanitizer.fail_closed = parse_bool_flag(v);
  if (const char* v = env_value("DOCSYNC_SALT_FINGERPRINT")) config.sanitizer.salt_label = v;

  if (const char* v = env_value("DOCSYNC_PII_SHIELD_TIMEOUT_MS")) {
    uint32_t ms = 0;
    if (parse_u32(v, &ms) && ms > 0) {
      config.sanitizer.timeout_ms = ms;
    } else {
      problems.push_back(std::string("DOCSYNC_PII_SHIELD_TIMEOUT_MS is not a positive integer: ") + v);
    }
  }
  if (const char* v = env_value("DOCSYNC_HASH_ALGORITHM")) {
    if (const auto alg = parse_hash_algorithm(v)) {
      config.hash_algorithm = *alg;
    } else {
      problems.push_back(std::string("DOCSYNC_HASH_ALGORITHM is not a known algorithm: ") + v);
    }
  }
  if (const char* v = env_value("DOCSYNC_MAX_WORKERS")) {
    uint32_t n = 0;
    if (parse_u32(v, &n) && n > 0) {
      config.max_workers = n;
    } else {
      problems.push_back(std::string("DOCSYNC_MAX_WORKERS is not a positive integer: ") + v);
    }
  }
  return problems;
}

}  // namespace docsync
