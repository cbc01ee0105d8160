#pragma once

// docsync/sanitizer.hpp — Redaction capability seam and the sanitization
// coordinator.
//
// TRUST CONTRACT (must not be broken):
//   1. A summary reports "sanitized" only when the bulk pass output was parsed,
//      structurally verified and substituted for the results. In that case no
//      literal the capability redacted survives anywhere in the pack.
//   2. Any failure of the bulk structural check discards ALL redacted content
//      (including the per-field pass), restores the original results
//      byte-for-byte, and reports "partial".
//   3. Under fail-open a raising per-field call keeps that field's original
//      text and the pass continues; the document then reports at best
//      "partial". A raising bulk call restores the original results and
//      reports "error" with zero redactions. Under fail-closed any raising
//      call escalates as SanitizerFailure and the document produces no pack.
//   4. Every local recovery emits one warning LogEvent with error type and
//      stage. No retry is ever attempted.
//
// STATE MACHINE (per document):
//   none -> requested -> applied (sanitized | none)
//                      | degraded (partial)
//                      | errored (error, fail-open only)
//                      | aborted (fail-closed, exception)
//
// RESPONSE NORMALIZATION:
//   The capability returns a loosely typed object. normalize_redaction_response
//   resolves every field through an explicit synonym table (snake_case first,
//   then camelCase and legacy spellings) with a fixed default, so the mapping
//   is auditable and total.

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docsync/config.hpp"
#include "docsync/jsonlite.hpp"
#include "docsync/observability.hpp"
#include "docsync/types.hpp"

namespace docsync {

// Request options of one redaction call.
struct SanitizeOptions {
  std::string input_format{"text"};  // "text" | "json" | "diff"
  std::string purpose{"docsync_pack"};
  bool deterministic{true};
  bool preserve_line_numbers{true};
  bool include_findings{false};
};

// {text, input_format, purpose, deterministic, preserve_line_numbers,
//  include_findings}
jsonlite::Object sanitize_request_body(const std::string& text, const SanitizeOptions& options);

// ---------------------------------------------------------------------------
// IRedactionCapability — abstract external redaction service
// ---------------------------------------------------------------------------
// Implementations MUST be safe for concurrent calls: documents are sanitized
// by independent workers sharing one capability.
class IRedactionCapability {
 public:
  virtual ~IRedactionCapability() = default;

  // Returns the raw response object. Throws (SanitizerFailure for transport,
  // timeout and malformed bodies) on failure.
  virtual jsonlite::Object sanitize(const std::string& text, const SanitizeOptions& options) = 0;
};

// Normalized view of one response.
struct NormalizedRedaction {
  std::string sanitized_text;
  bool changed{false};
  uint64_t redaction_count{0};
  std::map<std::string, uint64_t> redactions_by_type;
  std::string engine_name{"pii-shield"};
  std::string engine_version{"unknown"};
  RedactionMethod method{RedactionMethod::provider_native};
  SanitizationStatus status{SanitizationStatus::none};
  std::string token_format;
  std::string input_hash;   // "sha256:<hex>", computed locally if absent
  std::string output_hash;
};

// Ordered response spellings per normalized field.
const std::map<std::string, std::vector<std::string>>& response_synonyms();

// stage only adds context to the coercion warnings.
NormalizedRedaction normalize_redaction_response(const jsonlite::Object& body,
                                                 const std::string& original_text,
                                                 const std::string& stage = "");

// "sha256:<hex>" passes through (lowercased); any other non-empty label is
// hashed into that shape; "" stays "".
std::string normalize_salt_fingerprint(const std::string& label);

enum class SanitizationState { none, requested, applied, degraded, errored, aborted };

std::string to_string(SanitizationState state);

struct SanitizationOutcome {
  std::vector<ClaimResult> results;
  SanitizationSummary summary;
  SanitizationState state{SanitizationState::none};
};

// Stage names recorded in SanitizationSummary::applied_to.
inline constexpr const char* kStageClaimText = "claim_text";
inline constexpr const char* kStageMessage = "message";
inline constexpr const char* kStageBulk = "docsync_pack";

// ---------------------------------------------------------------------------
// SanitizationCoordinator
// ---------------------------------------------------------------------------
// Thread-safety: sanitize() is const and keeps all per-document state on the
// stack; the only shared objects are the capability and the RunStats counters.
class SanitizationCoordinator {
 public:
  SanitizationCoordinator(std::shared_ptr<IRedactionCapability> capability,
                          SanitizerConfig config, RunStats* stats = nullptr);

  // Runs the per-field and bulk passes over a copy of results. Throws
  // SanitizerFailure under fail-closed when the capability raises.
  SanitizationOutcome sanitize(const std::vector<ClaimResult>& results,
                               const std::string& document = "") const;

  const SanitizerConfig& config() const { return config_; }

 private:
  std::shared_ptr<IRedactionCapability> capability_;
  SanitizerConfig config_;
  RunStats* stats_;
};

}  // namespace docsync
