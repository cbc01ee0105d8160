#include "docsync/pii_shield_client.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include <httplib.h>

#include "docsync/errors.hpp"
#include "docsync/jsonlite.hpp"

namespace docsync {

bool split_endpoint(const std::string& url, EndpointParts* out) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) return false;
  const auto host_begin = scheme_end + 3;
  const auto path_begin = url.find('/', host_begin);
  const std::string base = url.substr(0, path_begin);
  if (base.size() <= host_begin) return false;
  out->base = base;
  out->path = path_begin == std::string::npos ? "/" : url.substr(path_begin);
  return true;
}

PiiShieldClient::PiiShieldClient(SanitizerConfig config) : config_(std::move(config)) {}

jsonlite::Object PiiShieldClient::sanitize(const std::string& text, const SanitizeOptions& options) {
  if (config_.endpoint.empty()) throw SanitizerFailure("PII-Shield endpoint is not configured");
  EndpointParts parts;
  if (!split_endpoint(config_.endpoint, &parts))
    throw SanitizerFailure("PII-Shield endpoint is not a valid URL: " + config_.endpoint);

  httplib::Client cli(parts.base);
  const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);

  httplib::Headers headers;
  if (!config_.api_key.empty()) headers.emplace("Authorization", "Bearer " + config_.api_key);

  const std::string payload = jsonlite::to_json(jsonlite::Value{sanitize_request_body(text, options)});

  const auto started = std::chrono::steady_clock::now();
  auto res = cli.Post(parts.path, headers, payload, "application/json");
  if (!res) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed >= timeout) {
      throw SanitizerFailure("PII-Shield request timed out after " +
                                 std::to_string(config_.timeout_ms) + " ms",
                             ErrorCode::sanitizer_timeout);
    }
    throw SanitizerFailure("PII-Shield request failed: " + httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    throw SanitizerFailure("PII-Shield returned HTTP " + std::to_string(res->status));
  }
  if (res->body.empty()) return {};

  std::optional<jsonlite::JsonError> err;
  jsonlite::Value body = jsonlite::parse_value(res->body, &err);
  if (err) throw SanitizerFailure("PII-Shield response is not valid JSON: " + err->message);
  if (!body.is_object()) throw SanitizerFailure("PII-Shield response must be a JSON object");
  return std::get<jsonlite::Object>(std::move(body.v));
}

}  // namespace docsync
