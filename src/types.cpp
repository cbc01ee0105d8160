#include "docsync/types.hpp"
#include "docsync/errors.hpp"
#include "docsync/jsonlite.hpp"

#include <ctime>
#include <sstream>

namespace docsync {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_error: return "validation_error";
    case ErrorCode::manifest_not_found: return "manifest_not_found";
    case ErrorCode::pack_not_found: return "pack_not_found";
    case ErrorCode::structural_decode_error: return "structural_decode_error";
    case ErrorCode::chain_integrity_error: return "chain_integrity_error";
    case ErrorCode::sanitizer_failure: return "sanitizer_failure";
    case ErrorCode::sanitizer_timeout: return "sanitizer_timeout";
    case ErrorCode::io_error: return "io_error";
  }
  return "";
}

namespace {
std::string join_errors(const std::vector<std::string>& errors) {
  std::ostringstream o;
  o << "validation failed";
  for (const auto& e : errors) o << "\n  - " << e;
  return o.str();
}
}  // namespace

ValidationError::ValidationError(std::vector<std::string> errors, ErrorCode code)
    : Error(code, join_errors(errors)), errors_(std::move(errors)) {}

std::string truncate_utf8(const std::string& text, std::size_t max_code_points) {
  std::size_t i = 0;
  std::size_t count = 0;
  while (i < text.size() && count < max_code_points) {
    (void)jsonlite::next_code_point(text, i);
    ++count;
  }
  return i >= text.size() ? text : text.substr(0, i);
}

std::size_t utf8_length(const std::string& text) {
  std::size_t i = 0;
  std::size_t count = 0;
  while (i < text.size()) {
    (void)jsonlite::next_code_point(text, i);
    ++count;
  }
  return count;
}

std::string to_string(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::pass: return "pass";
    case ClaimStatus::fail: return "fail";
    case ClaimStatus::skip: return "skip";
  }
  return "skip";
}

std::optional<ClaimStatus> parse_claim_status(const std::string& text) {
  if (text == "pass") return ClaimStatus::pass;
  if (text == "fail") return ClaimStatus::fail;
  if (text == "skip") return ClaimStatus::skip;
  return std::nullopt;
}

std::string to_string(SanitizationStatus status) {
  switch (status) {
    case SanitizationStatus::sanitized: return "sanitized";
    case SanitizationStatus::none: return "none";
    case SanitizationStatus::partial: return "partial";
    case SanitizationStatus::error: return "error";
  }
  return "none";
}

std::optional<SanitizationStatus> parse_sanitization_status(const std::string& text) {
  if (text == "sanitized") return SanitizationStatus::sanitized;
  if (text == "none") return SanitizationStatus::none;
  if (text == "partial") return SanitizationStatus::partial;
  if (text == "error") return SanitizationStatus::error;
  return std::nullopt;
}

std::string to_string(RedactionMethod method) {
  switch (method) {
    case RedactionMethod::deterministic_hmac: return "deterministic_hmac";
    case RedactionMethod::provider_native: return "provider_native";
    case RedactionMethod::entropy_hmac: return "entropy+hmac";
  }
  return "provider_native";
}

std::optional<RedactionMethod> parse_redaction_method(const std::string& text) {
  if (text == "deterministic_hmac") return RedactionMethod::deterministic_hmac;
  if (text == "provider_native") return RedactionMethod::provider_native;
  if (text == "entropy+hmac") return RedactionMethod::entropy_hmac;
  return std::nullopt;
}

std::string utc_timestamp_now() {
  const std::time_t now = std::time(nullptr);
  std::tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm_utc);
  return std::string(buf, n);
}

}  // namespace docsync
