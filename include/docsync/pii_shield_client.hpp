#pragma once

// docsync/pii_shield_client.hpp — HTTP transport for the redaction capability.
//
// POSTs sanitize_request_body() as JSON to the configured endpoint:
//   Content-Type: application/json
//   Authorization: Bearer <api_key>      (only when a key is configured)
// Connect, read and write timeouts are all set to SanitizerConfig::timeout_ms.
//
// Every failure raises SanitizerFailure: missing endpoint, transport error,
// timeout (code sanitizer_timeout), non-2xx status, non-JSON or non-object
// body. Policy (fail-open / fail-closed) is NOT decided here; the coordinator
// owns it. No retries.
//
// Thread-safety: each call builds its own httplib::Client, so one instance can
// serve concurrent document workers.

#include <string>

#include "docsync/config.hpp"
#include "docsync/sanitizer.hpp"

namespace docsync {

struct EndpointParts {
  std::string base;  // "scheme://host[:port]"
  std::string path;  // "/..." (defaults to "/")
};

// Split an endpoint URL. Returns false if it has no scheme or host.
bool split_endpoint(const std::string& url, EndpointParts* out);

class PiiShieldClient final : public IRedactionCapability {
 public:
  explicit PiiShieldClient(SanitizerConfig config);

  jsonlite::Object sanitize(const std::string& text, const SanitizeOptions& options) override;

 private:
  SanitizerConfig config_;
};

}  // namespace docsync
