#pragma once

// docsync/runner.hpp — NightlyRunner: manifest in, one frozen pack per document out.
//
// PIPELINE (per document):
//   ClaimEvaluator (every claim, manifest order)
//     -> SanitizationCoordinator (only when a capability is configured)
//     -> ChainBuilder::freeze
//     -> ChainBuilder::require_verified
//
// CONCURRENCY:
//   Documents share no mutable state, so up to max_workers documents run at
//   once on a bounded pool. Outcomes are returned in manifest order regardless
//   of completion order. Within a document, mutation of results ends before the
//   freeze; afterwards the pack is shared read-only.
//
// FAILURE POLICY:
//   A fail-closed SanitizerFailure aborts only its document: the outcome has
//   no pack and carries the error. Any other exception (including
//   ChainIntegrityError from the post-freeze check) is rethrown from run()
//   after all workers have joined, the lowest document index first.

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docsync/config.hpp"
#include "docsync/errors.hpp"
#include "docsync/evaluator.hpp"
#include "docsync/manifest.hpp"
#include "docsync/observability.hpp"
#include "docsync/sanitizer.hpp"
#include "docsync/types.hpp"

namespace docsync {

struct DocumentOutcome {
  std::size_t doc_index{0};
  std::string doc_path;
  std::shared_ptr<const EvidencePack> pack;  // null when the document was aborted
  SanitizationState sanitization_state{SanitizationState::none};
  std::string error;
  ErrorCode error_code{ErrorCode::none};

  bool ok() const { return pack != nullptr; }
};

class NightlyRunner {
 public:
  // capability may be null: packs are then produced without a summary.
  explicit NightlyRunner(RunnerConfig config,
                         std::shared_ptr<IRedactionCapability> capability = nullptr);

  NightlyRunner(const NightlyRunner&) = delete;
  NightlyRunner& operator=(const NightlyRunner&) = delete;

  // manifest_text is hashed into manifest_hash.
  std::vector<DocumentOutcome> run(const DocManifest& manifest, const std::string& manifest_text);

  // Single document. Throws SanitizerFailure under fail-closed.
  std::shared_ptr<const EvidencePack> process_document(const DocEntry& doc,
                                                       const std::string& manifest_hash,
                                                       SanitizationState* state = nullptr);

  ClaimEvaluator& evaluator() { return evaluator_; }
  const RunStats& stats() const { return stats_; }
  const RunnerConfig& config() const { return config_; }

 private:
  RunnerConfig config_;
  ClaimEvaluator evaluator_;
  RunStats stats_;
  std::optional<SanitizationCoordinator> coordinator_;
};

}  // namespace docsync
