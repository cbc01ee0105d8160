#include "docsync/runner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>
#include <utility>

#include "docsync/chain.hpp"
#include "docsync/hash.hpp"
#include "docsync/version.hpp"

namespace docsync {

NightlyRunner::NightlyRunner(RunnerConfig config, std::shared_ptr<IRedactionCapability> capability)
    : config_(std::move(config)),
      evaluator_(ClaimEvaluator::with_default_adapters(config_.repo_root)) {
  evaluator_.set_parallel_evidence(config_.parallel_evidence);
  if (capability) coordinator_.emplace(std::move(capability), config_.sanitizer, &stats_);
}

std::shared_ptr<const EvidencePack> NightlyRunner::process_document(const DocEntry& doc,
                                                                    const std::string& manifest_hash,
                                                                    SanitizationState* state) {
  EvidencePack pack;
  pack.manifest_hash = manifest_hash;
  pack.runner = version::RUNNER_NAME;
  pack.runner_version = version::RUNNER_SEMVER;
  pack.timestamp = utc_timestamp_now();

  pack.results.reserve(doc.claims.size());
  for (const auto& claim : doc.claims) pack.results.push_back(evaluator_.evaluate(claim));

  if (coordinator_) {
    SanitizationOutcome outcome = coordinator_->sanitize(pack.results, doc.path);
    pack.results = std::move(outcome.results);
    pack.sanitization = std::move(outcome.summary);
    if (state) *state = outcome.state;
  }

  for (const auto& r : pack.results) {
    switch (r.status) {
      case ClaimStatus::pass: stats_.claims_pass.fetch_add(1, std::memory_order_relaxed); break;
      case ClaimStatus::fail: stats_.claims_fail.fetch_add(1, std::memory_order_relaxed); break;
      case ClaimStatus::skip: stats_.claims_skip.fetch_add(1, std::memory_order_relaxed); break;
    }
  }

  auto frozen = ChainBuilder(config_.hash_algorithm).freeze(std::move(pack));
  ChainBuilder::require_verified(*frozen);
  stats_.documents_processed.fetch_add(1, std::memory_order_relaxed);
  return frozen;
}

std::vector<DocumentOutcome> NightlyRunner::run(const DocManifest& manifest,
                                                const std::string& manifest_text) {
  const std::string manifest_hash = hash_text(config_.hash_algorithm, manifest_text);
  const std::size_t n = manifest.docs.size();

  std::vector<DocumentOutcome> outcomes(n);
  std::vector<std::exception_ptr> failures(n);

  // Bounded pool; each worker writes only its own outcome slot.
  const std::size_t workers_wanted = std::max<std::size_t>(1, config_.max_workers);
  const std::size_t worker_count = std::min(workers_wanted, std::max<std::size_t>(1, n));
  std::atomic<std::size_t> next_job{0};

  const auto work = [&]() {
    for (;;) {
      const std::size_t idx = next_job.fetch_add(1);
      if (idx >= n) break;
      const DocEntry& doc = manifest.docs[idx];
      DocumentOutcome& out = outcomes[idx];
      out.doc_index = idx;
      out.doc_path = doc.path;
      try {
        out.pack = process_document(doc, manifest_hash, &out.sanitization_state);
      } catch (const SanitizerFailure& e) {
        out.sanitization_state = SanitizationState::aborted;
        out.error = e.what();
        out.error_code = e.code();
        stats_.documents_aborted.fetch_add(1, std::memory_order_relaxed);
        emit_log_event(LogEvent{LogLevel::error, "document aborted by fail-closed sanitizer",
                                kStageBulk, e.type_name(), doc.path, e.what()});
      } catch (const std::exception& e) {
        out.error = e.what();
        failures[idx] = std::current_exception();
      }
    }
  };

  if (worker_count == 1) {
    work();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t w = 0; w < worker_count; ++w) workers.emplace_back(work);
    for (auto& t : workers) t.join();
  }

  for (const auto& f : failures) {
    if (f) std::rethrow_exception(f);
  }
  return outcomes;
}

}  // namespace docsync
