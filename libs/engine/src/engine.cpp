#include "paycore/engine/engine.hpp"

#include <utility>

namespace paycore {
namespace engine {

Engine::Engine() = default;

Engine::Engine(const Config& config, RejectionHandler on_reject)
    : router_(router::TransactionRouter::Config{.allow_zero_amounts = config.allow_zero_amounts}),
      on_reject_(std::move(on_reject)) {}

ledger::ApplyResult Engine::apply(const common::TransactionRecord& record) {
  auto result = router_.route(ledger_, record);
  ++stats_.by_outcome[static_cast<std::size_t>(result.outcome)];

  if (result.applied()) {
    ++stats_.applied;
    return result;
  }

  ++stats_.rejected;
  if (on_reject_) {
    on_reject_(record, result);
  }
  return result;
}

void Engine::record_malformed() {
  ++stats_.malformed;
  ++stats_.by_outcome[static_cast<std::size_t>(ledger::Outcome::kRejectedMalformedRecord)];
}

std::vector<ledger::AccountSnapshot> Engine::snapshot(ledger::SnapshotOrder order) const {
  return ledger_.snapshot(order);
}

void Engine::reset_stats() {
  stats_ = {};
}

}  // namespace engine
}  // namespace paycore
