#pragma once

#include "paycore/common/types.hpp"
#include "paycore/ledger/apply_result.hpp"
#include "paycore/ledger/ledger.hpp"

namespace paycore {
namespace router {

// Validates a record against the ledger in a fixed order (amount, lock,
// reference and owner) and dispatches it to the matching ledger mutation.
class TransactionRouter {
 public:
  struct Config {
    bool allow_zero_amounts{true};
  };

  TransactionRouter() = default;
  explicit TransactionRouter(const Config& config) : config_(config) {}

  [[nodiscard]] ledger::ApplyResult route(ledger::Ledger& ledger, const common::TransactionRecord& record) const;

  [[nodiscard]] const Config& config() const noexcept { return config_; }

 private:
  Config config_{};

  [[nodiscard]] bool valid_amount(const common::TransactionRecord& record) const;
};

}  // namespace router
}  // namespace paycore
