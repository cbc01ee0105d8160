#pragma once

// docsync/evaluator.hpp — Claim evaluation against registered evidence adapters.
//
// AGGREGATION RULE:
//   no evidence specs          -> skip, "no evidence specs defined"
//   any returned ref matched   -> pass, "<matched>/<total> evidence found"
//   otherwise                  -> fail, "no matching evidence found"
//
// Evidence is appended in spec order, and within a spec in adapter order. It
// is never re-sorted. With parallel_evidence the specs are searched
// concurrently (one thread per spec) but the results are still concatenated
// in spec order.
//
// The evaluator does not guard against the inspected tree changing between
// two evaluations. Callers that need a stable verdict must hold the tree still.

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "docsync/adapters.hpp"
#include "docsync/manifest.hpp"
#include "docsync/types.hpp"

namespace docsync {

inline constexpr const char* kMessageNoSpecs = "no evidence specs defined";
inline constexpr const char* kMessageNoMatch = "no matching evidence found";

class ClaimEvaluator {
 public:
  ClaimEvaluator() = default;

  // Registers CodeAdapter and MarkdownAdapter rooted at repo_root.
  static ClaimEvaluator with_default_adapters(const std::string& repo_root);

  // Adapters are shared read-only; later registrations replace earlier ones.
  void register_adapter(std::shared_ptr<const IEvidenceAdapter> adapter);

  void set_parallel_evidence(bool enabled) { parallel_evidence_ = enabled; }

  // Refs for one spec. An unregistered discriminator yields no refs.
  std::vector<EvidenceRef> collect(const EvidenceSpec& spec) const;

  ClaimResult evaluate(const ClaimEntry& claim) const;

 private:
  std::map<std::string, std::shared_ptr<const IEvidenceAdapter>> adapters_;
  bool parallel_evidence_{false};
};

// Verdict and message for an already-collected evidence list.
// spec_count == 0 always yields skip.
void aggregate_verdict(std::size_t spec_count, const std::vector<EvidenceRef>& evidence,
                       ClaimStatus* status, std::string* message);

}  // namespace docsync
