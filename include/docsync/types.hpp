#pragma once

// docsync/types.hpp — Core data structures for evidence packs.
//
// LIFECYCLE:
//   ClaimEvaluator creates ClaimResult values. SanitizationCoordinator may
//   rewrite claim_text/message (and, through the bulk pass, the whole result)
//   exactly once. ChainBuilder then freezes the pack; after that the pack is
//   shared as std::shared_ptr<const EvidencePack> and never mutated again.
//
// DETERMINISM:
//   - Evidence order is the order adapters returned it in, spec by spec.
//   - redactions_by_type and applied_to are ordered containers, so every
//     serialization of a summary is byte-stable.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. No borrowed references, no raw pointers.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "docsync/hash.hpp"

namespace docsync {

// Maximum snippet length, in Unicode code points.
inline constexpr std::size_t kMaxSnippetLength = 120;

// Truncate to at most max_code_points code points without splitting a UTF-8
// sequence. Invalid lead bytes count as one code point each.
std::string truncate_utf8(const std::string& text, std::size_t max_code_points);

// Number of code points, counted the same way truncate_utf8 counts them.
std::size_t utf8_length(const std::string& text);

// ---------------------------------------------------------------------------
// EvidenceRef — a located excerpt produced read-only by a search adapter.
// ---------------------------------------------------------------------------
struct EvidenceRef {
  std::string source_type;  // "code" | "markdown"
  std::string path;         // repo-relative, '/'-separated
  uint64_t line{0};         // 1-based, 0 = N/A
  std::string snippet;      // <= kMaxSnippetLength code points
  bool matched{false};

  EvidenceRef() = default;
  EvidenceRef(std::string source_type_in, std::string path_in, uint64_t line_in,
              const std::string& snippet_in, bool matched_in)
      : source_type(std::move(source_type_in)),
        path(std::move(path_in)),
        line(line_in),
        snippet(truncate_utf8(snippet_in, kMaxSnippetLength)),
        matched(matched_in) {}

  bool operator==(const EvidenceRef& other) const = default;
};

enum class ClaimStatus { pass, fail, skip };

std::string to_string(ClaimStatus status);
std::optional<ClaimStatus> parse_claim_status(const std::string& text);

struct ClaimResult {
  std::string claim_id;
  std::string claim_text;
  ClaimStatus status{ClaimStatus::skip};
  std::vector<EvidenceRef> evidence;
  std::string message;

  bool operator==(const ClaimResult& other) const = default;
};

// ---------------------------------------------------------------------------
// ChainLink — one hash-linked record binding a result to its predecessor.
// ---------------------------------------------------------------------------
struct ChainLink {
  uint64_t sequence{0};
  std::string item_id;       // "claim-<sequence>"
  std::string content_type;  // version::CLAIM_CONTENT_TYPE
  std::string content_hash;  // H(canonical_json(result))
  std::string previous_hash; // genesis sentinel for link 0
  std::string chain_hash;

  bool operator==(const ChainLink& other) const = default;
};

// ---------------------------------------------------------------------------
// Sanitization summary
// ---------------------------------------------------------------------------
enum class SanitizationStatus { sanitized, none, partial, error };

std::string to_string(SanitizationStatus status);
std::optional<SanitizationStatus> parse_sanitization_status(const std::string& text);

// Closed set of redaction methods. Unrecognized values coerce to provider_native.
enum class RedactionMethod { deterministic_hmac, provider_native, entropy_hmac };

std::string to_string(RedactionMethod method);
std::optional<RedactionMethod> parse_redaction_method(const std::string& text);

struct SanitizationSummary {
  std::string engine_name{"pii-shield"};
  std::string engine_version{"unknown"};
  RedactionMethod method{RedactionMethod::provider_native};
  std::string token_format;
  std::string salt_fingerprint;  // "sha256:<hex>" or empty
  uint64_t redaction_count{0};
  std::map<std::string, uint64_t> redactions_by_type;
  std::string input_hash;
  std::string output_hash;
  std::set<std::string> applied_to;  // stage names
  SanitizationStatus status{SanitizationStatus::none};

  bool operator==(const SanitizationSummary& other) const = default;
};

// ---------------------------------------------------------------------------
// EvidencePack — the artifact of one document's run.
// ---------------------------------------------------------------------------
struct EvidencePack {
  std::string manifest_hash;
  std::string runner;
  std::string runner_version;
  std::string timestamp;  // ISO-8601 UTC, seconds precision
  std::vector<ClaimResult> results;

  // Integrity proof. chain and hash_chain describe the same links; the flat
  // view exists for older consumers and is always reconstructed on read.
  std::vector<ChainLink> chain;
  std::vector<std::string> hash_chain;
  std::string root_hash;
  HashAlgorithm hash_algorithm{HashAlgorithm::sha256};
  uint32_t chain_algorithm_version{0};  // 0 = not frozen yet

  std::optional<SanitizationSummary> sanitization;

  bool frozen() const { return chain_algorithm_version != 0; }
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SS+00:00".
std::string utc_timestamp_now();

}  // namespace docsync
