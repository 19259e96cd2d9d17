#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "paycore/common/types.hpp"
#include "paycore/ledger/apply_result.hpp"
#include "paycore/ledger/ledger.hpp"
#include "paycore/router/transaction_router.hpp"

namespace paycore {
namespace engine {

// Caller-facing surface of the core: apply records in arrival order, then
// take a snapshot of the accounts. Not thread-safe.
class Engine {
 public:
  struct Config {
    bool allow_zero_amounts{true};
  };

  struct Stats {
    std::uint64_t applied{0};
    std::uint64_t rejected{0};
    std::uint64_t malformed{0};
    std::array<std::uint64_t, ledger::kOutcomeCount> by_outcome{};

    [[nodiscard]] std::uint64_t count(ledger::Outcome outcome) const noexcept {
      return by_outcome[static_cast<std::size_t>(outcome)];
    }
  };

  using RejectionHandler = std::function<void(const common::TransactionRecord&, const ledger::ApplyResult&)>;

  Engine();
  explicit Engine(const Config& config, RejectionHandler on_reject = RejectionHandler{});

  ledger::ApplyResult apply(const common::TransactionRecord& record);
  void record_malformed();

  [[nodiscard]] std::vector<ledger::AccountSnapshot> snapshot(
      ledger::SnapshotOrder order = ledger::SnapshotOrder::kByClient) const;

  [[nodiscard]] const ledger::Ledger& ledger() const noexcept { return ledger_; }
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  void reset_stats();

 private:
  ledger::Ledger ledger_{};
  router::TransactionRouter router_{};
  RejectionHandler on_reject_{};
  Stats stats_{};
};

}  // namespace engine
}  // namespace paycore
