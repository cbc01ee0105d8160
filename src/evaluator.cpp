#include "docsync/evaluator.hpp"

#include <exception>
#include <iterator>
#include <thread>

namespace docsync {

ClaimEvaluator ClaimEvaluator::with_default_adapters(const std::string& repo_root) {
  ClaimEvaluator evaluator;
  evaluator.register_adapter(std::make_shared<CodeAdapter>(repo_root));
  evaluator.register_adapter(std::make_shared<MarkdownAdapter>(repo_root));
  return evaluator;
}

void ClaimEvaluator::register_adapter(std::shared_ptr<const IEvidenceAdapter> adapter) {
  if (!adapter) return;
  adapters_[adapter->source_type()] = std::move(adapter);
}

std::vector<EvidenceRef> ClaimEvaluator::collect(const EvidenceSpec& spec) const {
  auto it = adapters_.find(spec.type);
  if (it == adapters_.end()) return {};
  return it->second->search(spec.pattern, spec.scope);
}

void aggregate_verdict(std::size_t spec_count, const std::vector<EvidenceRef>& evidence,
                       ClaimStatus* status, std::string* message) {
  if (spec_count == 0) {
    *status = ClaimStatus::skip;
    *message = kMessageNoSpecs;
    return;
  }
  std::size_t matched = 0;
  for (const auto& ref : evidence) {
    if (ref.matched) ++matched;
  }
  if (matched > 0) {
    *status = ClaimStatus::pass;
    *message = std::to_string(matched) + "/" + std::to_string(evidence.size()) +
               " evidence found";
  } else {
    *status = ClaimStatus::fail;
    *message = kMessageNoMatch;
  }
}

ClaimResult ClaimEvaluator::evaluate(const ClaimEntry& claim) const {
  ClaimResult result;
  result.claim_id = claim.id;
  result.claim_text = claim.text;

  if (parallel_evidence_ && claim.evidence.size() > 1) {
    // Adapters are read-only, so specs are independent. Each worker fills its
    // own slot; slots are concatenated in spec order.
    const std::size_t n = claim.evidence.size();
    std::vector<std::vector<EvidenceRef>> slots(n);
    std::vector<std::exception_ptr> failures(n);
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      workers.emplace_back([&, i]() {
        try {
          slots[i] = collect(claim.evidence[i]);
        } catch (const std::exception&) {
          failures[i] = std::current_exception();
        }
      });
    }
    for (auto& t : workers) t.join();
    for (std::size_t i = 0; i < n; ++i) {
      if (failures[i]) std::rethrow_exception(failures[i]);
      result.evidence.insert(result.evidence.end(), std::make_move_iterator(slots[i].begin()),
                             std::make_move_iterator(slots[i].end()));
    }
  } else {
    for (const auto& spec : claim.evidence) {
      auto refs = collect(spec);
      result.evidence.insert(result.evidence.end(), std::make_move_iterator(refs.begin()),
                             std::make_move_iterator(refs.end()));
    }
  }

  aggregate_verdict(claim.evidence.size(), result.evidence, &result.status, &result.message);
  return result;
}

}  // namespace docsync
