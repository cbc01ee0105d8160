#include "docsync/sanitizer.hpp"

#include <cctype>
#include <cmath>
#include <exception>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include "docsync/claims.hpp"
#include "docsync/errors.hpp"
#include "docsync/hash.hpp"

namespace docsync {

namespace {

const jsonlite::Value* lookup(const jsonlite::Object& body, const std::string& field) {
  const auto& table = response_synonyms();
  const auto it = table.find(field);
  if (it == table.end()) return nullptr;
  for (const auto& key : it->second) {
    const jsonlite::Value* v = jsonlite::find(body, key);
    if (v && !v->is_null()) return v;
  }
  return nullptr;
}

// First synonym holding a string. Keys holding other types are skipped.
const std::string* lookup_string(const jsonlite::Object& body, const std::string& field) {
  const auto& keys = response_synonyms().at(field);
  for (const auto& key : keys) {
    const jsonlite::Value* v = jsonlite::find(body, key);
    if (v && v->is_string()) return &std::get<std::string>(v->v);
  }
  return nullptr;
}

uint64_t coerce_count(const jsonlite::Value& v, const std::string& field, const std::string& stage) {
  if (v.is_u64()) return std::get<std::uint64_t>(v.v);
  if (v.is_double()) {
    const double d = std::get<double>(v.v);
    if (!std::isfinite(d) || d <= 0.0) return 0;
    if (d >= static_cast<double>(std::numeric_limits<uint64_t>::max()))
      return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(d);
  }
  log_warning("non-numeric redaction count coerced to 0", stage, "SanitizerFailure", "", field);
  return 0;
}

std::string redaction_label(const jsonlite::Value& item) {
  if (!item.is_object()) return "unknown";
  const auto& obj = std::get<jsonlite::Object>(item.v);
  for (const char* key : {"type", "category", "label"}) {
    const std::string label = jsonlite::get_string(obj, key);
    if (!label.empty()) return label;
  }
  return "unknown";
}

const char* error_type_of(const std::exception& e) {
  if (const auto* err = dynamic_cast<const Error*>(&e)) return err->type_name();
  return "std::exception";
}

bool is_hex_digest_label(const std::string& label) {
  static const std::string kPrefix = "sha256:";
  if (label.size() <= kPrefix.size() || label.compare(0, kPrefix.size(), kPrefix) != 0) return false;
  for (std::size_t i = kPrefix.size(); i < label.size(); ++i) {
    if (!std::isxdigit(static_cast<unsigned char>(label[i]))) return false;
  }
  return true;
}

// Per-document accumulator. Lives on the stack of one sanitize() call.
struct PassTally {
  uint64_t redaction_count{0};
  std::map<std::string, uint64_t> redactions_by_type;
  bool engine_partial{false};
  std::set<std::string> stages;
  std::optional<NormalizedRedaction> last;

  void add(const NormalizedRedaction& n, const char* stage) {
    redaction_count += n.redaction_count;
    for (const auto& [type, count] : n.redactions_by_type) redactions_by_type[type] += count;
    if (n.status == SanitizationStatus::partial || n.status == SanitizationStatus::error)
      engine_partial = true;
    stages.insert(stage);
    last = n;
  }
};

}  // namespace

jsonlite::Object sanitize_request_body(const std::string& text, const SanitizeOptions& options) {
  jsonlite::Object body;
  body["text"] = text;
  body["input_format"] = options.input_format;
  body["purpose"] = options.purpose;
  body["deterministic"] = options.deterministic;
  body["preserve_line_numbers"] = options.preserve_line_numbers;
  body["include_findings"] = options.include_findings;
  return body;
}

const std::map<std::string, std::vector<std::string>>& response_synonyms() {
  static const std::map<std::string, std::vector<std::string>> kTable = {
      {"sanitized_text",
       {"sanitized_text", "sanitizedText", "redacted_text", "redactedText", "text", "output"}},
      {"changed", {"changed"}},
      {"redaction_count", {"redaction_count", "redactionCount"}},
      {"redactions_by_type", {"redactions_by_type", "redactionsByType"}},
      {"redactions", {"redactions", "findings"}},
      {"engine_name", {"engine_name", "engineName"}},
      {"engine_version",
       {"engine_version", "engineVersion", "version", "schema_version", "schemaVersion"}},
      {"method", {"method"}},
      {"status", {"status"}},
      {"token_format", {"token_format", "tokenFormat"}},
      {"input_hash", {"input_hash", "inputHash"}},
      {"output_hash", {"output_hash", "outputHash"}},
  };
  return kTable;
}

NormalizedRedaction normalize_redaction_response(const jsonlite::Object& body,
                                                 const std::string& original_text,
                                                 const std::string& stage) {
  NormalizedRedaction n;

  // An empty string is a valid redaction result and must not fall through.
  const std::string* text = lookup_string(body, "sanitized_text");
  n.sanitized_text = text ? *text : original_text;

  const jsonlite::Value* changed = lookup(body, "changed");
  n.changed = (changed && changed->is_bool()) ? std::get<bool>(changed->v)
                                              : n.sanitized_text != original_text;

  if (const jsonlite::Value* by_type = lookup(body, "redactions_by_type"); by_type && by_type->is_object()) {
    for (const auto& [type, count] : std::get<jsonlite::Object>(by_type->v))
      n.redactions_by_type[type] = coerce_count(count, "redactions_by_type." + type, stage);
  } else if (const jsonlite::Value* list = lookup(body, "redactions"); list && list->is_array()) {
    for (const auto& item : std::get<jsonlite::Array>(list->v)) ++n.redactions_by_type[redaction_label(item)];
  }

  if (const jsonlite::Value* count = lookup(body, "redaction_count")) {
    n.redaction_count = coerce_count(*count, "redaction_count", stage);
  } else {
    for (const auto& [type, c] : n.redactions_by_type) n.redaction_count += c;
    const jsonlite::Value* list = lookup(body, "redactions");
    if (n.redaction_count == 0 && list && list->is_array())
      n.redaction_count = std::get<jsonlite::Array>(list->v).size();
  }

  if (const std::string* v = lookup_string(body, "engine_name")) n.engine_name = *v;
  if (const std::string* v = lookup_string(body, "engine_version")) n.engine_version = *v;
  if (const std::string* v = lookup_string(body, "token_format")) n.token_format = *v;

  if (const std::string* v = lookup_string(body, "method")) {
    n.method = parse_redaction_method(*v).value_or(RedactionMethod::provider_native);
  }

  const std::string* status = lookup_string(body, "status");
  const auto parsed_status = status ? parse_sanitization_status(*status) : std::nullopt;
  n.status = parsed_status.value_or(n.changed ? SanitizationStatus::sanitized
                                              : SanitizationStatus::none);

  const std::string* in_hash = lookup_string(body, "input_hash");
  const std::string* out_hash = lookup_string(body, "output_hash");
  n.input_hash = in_hash ? *in_hash : hash_text(HashAlgorithm::sha256, original_text);
  n.output_hash = out_hash ? *out_hash : hash_text(HashAlgorithm::sha256, n.sanitized_text);
  return n;
}

std::string normalize_salt_fingerprint(const std::string& label) {
  if (label.empty()) return "";
  if (is_hex_digest_label(label)) {
    std::string out = label;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
  }
  return hash_text(HashAlgorithm::sha256, label);
}

std::string to_string(SanitizationState state) {
  switch (state) {
    case SanitizationState::none: return "none";
    case SanitizationState::requested: return "requested";
    case SanitizationState::applied: return "applied";
    case SanitizationState::degraded: return "degraded";
    case SanitizationState::errored: return "errored";
    case SanitizationState::aborted: return "aborted";
  }
  return "none";
}

// ---------------------------------------------------------------------------
// SanitizationCoordinator
// ---------------------------------------------------------------------------

SanitizationCoordinator::SanitizationCoordinator(std::shared_ptr<IRedactionCapability> capability,
                                                 SanitizerConfig config, RunStats* stats)
    : capability_(std::move(capability)), config_(std::move(config)), stats_(stats) {}

SanitizationOutcome SanitizationCoordinator::sanitize(const std::vector<ClaimResult>& results,
                                                      const std::string& document) const {
  SanitizationOutcome out;
  out.results = results;
  out.summary.salt_fingerprint = normalize_salt_fingerprint(config_.salt_label);
  const std::string original_json = canonical_results_json(results);
  out.summary.input_hash = hash_text(HashAlgorithm::sha256, original_json);
  out.summary.output_hash = out.summary.input_hash;
  if (!capability_) return out;

  out.state = SanitizationState::requested;

  // Restores the original results and zeroes every count.
  const auto revert = [&](SanitizationStatus status, SanitizationState state) {
    out.results = results;
    out.summary.redaction_count = 0;
    out.summary.redactions_by_type.clear();
    out.summary.applied_to.clear();
    out.summary.output_hash = out.summary.input_hash;
    out.summary.status = status;
    out.state = state;
  };

  // One capability call. nullopt means the call failed under fail-open.
  const auto call = [&](const std::string& text, const SanitizeOptions& options,
                        const char* stage) -> std::optional<NormalizedRedaction> {
    if (stats_) stats_->sanitizer_calls.fetch_add(1, std::memory_order_relaxed);
    try {
      jsonlite::Object body;
      if (stats_) {
        ScopeTimer timer(stats_->sanitizer_latency);
        body = capability_->sanitize(text, options);
      } else {
        body = capability_->sanitize(text, options);
      }
      return normalize_redaction_response(body, text, stage);
    } catch (const std::exception& e) {
      if (stats_) stats_->sanitizer_failures.fetch_add(1, std::memory_order_relaxed);
      if (config_.fail_closed) {
        out.state = SanitizationState::aborted;
        const auto* err = dynamic_cast<const Error*>(&e);
        const ErrorCode code = (err && err->code() == ErrorCode::sanitizer_timeout)
                                   ? ErrorCode::sanitizer_timeout
                                   : ErrorCode::sanitizer_failure;
        throw SanitizerFailure(std::string("PII sanitizer call failed at stage ") + stage + ": " +
                                   e.what(),
                               code);
      }
      log_warning("PII sanitizer call failed", stage, error_type_of(e), document, e.what());
      return std::nullopt;
    }
  };

  PassTally tally;
  SanitizeOptions field_options;
  field_options.input_format = "text";
  field_options.purpose = config_.purpose;
  field_options.include_findings = config_.include_findings;

  // Pass 1: per-field, on a working copy. A failed field keeps its original
  // text and the pass moves on to the next field.
  std::vector<ClaimResult> working = results;
  bool field_failed = false;
  for (auto& r : working) {
    for (auto [field, stage] : {std::pair<std::string*, const char*>{&r.claim_text, kStageClaimText},
                                std::pair<std::string*, const char*>{&r.message, kStageMessage}}) {
      if (field->empty()) continue;
      auto n = call(*field, field_options, stage);
      if (!n) {
        field_failed = true;
        continue;
      }
      *field = n->sanitized_text;
      tally.add(*n, stage);
    }
  }

  // Pass 2: bulk, over the canonical array of every result.
  SanitizeOptions bulk_options = field_options;
  bulk_options.input_format = "json";
  const std::string bulk_input = canonical_results_json(working);
  auto bulk = call(bulk_input, bulk_options, kStageBulk);
  if (!bulk) {
    revert(SanitizationStatus::error, SanitizationState::errored);
    return out;
  }

  // Structural-safety check: parse, array root, same length, strict decode,
  // unchanged verdicts.
  std::vector<ClaimResult> bulk_results;
  std::string rejection;
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Value parsed = jsonlite::parse_value(bulk->sanitized_text, &err);
  if (err) {
    rejection = "response is not valid JSON: " + err->message;
  } else if (!parsed.is_array()) {
    rejection = "response root is not an array";
  } else if (std::get<jsonlite::Array>(parsed.v).size() != results.size()) {
    rejection = "response has " + std::to_string(std::get<jsonlite::Array>(parsed.v).size()) +
                " results, expected " + std::to_string(results.size());
  } else {
    try {
      for (const auto& v : std::get<jsonlite::Array>(parsed.v))
        bulk_results.push_back(decode_claim_result(v));
      for (std::size_t i = 0; i < results.size() && rejection.empty(); ++i) {
        if (bulk_results[i].status != results[i].status ||
            bulk_results[i].evidence.size() != results[i].evidence.size()) {
          rejection = "response altered the verdict of result " + std::to_string(i);
        }
      }
    } catch (const StructuralDecodeError& e) {
      rejection = e.what();
    }
  }
  if (!rejection.empty()) {
    log_warning("PII sanitizer returned invalid response", kStageBulk, "StructuralDecodeError",
                document, rejection);
    if (stats_) stats_->sanitizer_degraded.fetch_add(1, std::memory_order_relaxed);
    revert(SanitizationStatus::partial, SanitizationState::degraded);
    return out;
  }
  tally.add(*bulk, kStageBulk);

  out.results = std::move(bulk_results);
  out.summary.engine_name = tally.last->engine_name;
  out.summary.engine_version = tally.last->engine_version;
  out.summary.method = tally.last->method;
  out.summary.token_format = tally.last->token_format;
  out.summary.redaction_count = tally.redaction_count;
  out.summary.redactions_by_type = std::move(tally.redactions_by_type);
  out.summary.applied_to = std::move(tally.stages);
  out.summary.output_hash = hash_text(HashAlgorithm::sha256, canonical_results_json(out.results));

  const bool substituted = out.results != results;
  if (field_failed) {
    // The bulk pass covered every field, but a stage did not complete.
    out.summary.status = SanitizationStatus::partial;
    out.state = SanitizationState::degraded;
    if (stats_) stats_->sanitizer_degraded.fetch_add(1, std::memory_order_relaxed);
  } else if (tally.engine_partial) {
    out.summary.status = SanitizationStatus::partial;
    out.state = SanitizationState::degraded;
    if (stats_) stats_->sanitizer_degraded.fetch_add(1, std::memory_order_relaxed);
  } else if (substituted) {
    out.summary.status = SanitizationStatus::sanitized;
    out.state = SanitizationState::applied;
  } else if (out.summary.redaction_count > 0) {
    // Redactions were reported but the text came back unchanged.
    log_warning("PII sanitizer reported redactions without changing the text", kStageBulk,
                "SanitizerFailure", document);
    out.summary.status = SanitizationStatus::partial;
    out.state = SanitizationState::degraded;
    if (stats_) stats_->sanitizer_degraded.fetch_add(1, std::memory_order_relaxed);
  } else {
    out.summary.status = SanitizationStatus::none;
    out.state = SanitizationState::applied;
  }
  return out;
}

}  // namespace docsync
