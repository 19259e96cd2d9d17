#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

enum class Outcome : std::uint8_t {
  kApplied,
  kRejectedMalformedRecord,
  kRejectedDuplicateTransactionId,
  kRejectedUnknownReference,
  kRejectedOwnerMismatch,
  kRejectedInvalidStateTransition,
  kRejectedInsufficientFunds,
  kRejectedAccountLocked,
  kRejectedBalanceOverflow,
};

inline constexpr std::size_t kOutcomeCount = 9;

struct ApplyResult {
  Outcome outcome{Outcome::kApplied};
  std::uint16_t reject_code{0};
  common::TxKind kind{common::TxKind::kDeposit};
  common::TxId tx{0};
  common::ClientId client{0};

  [[nodiscard]] bool applied() const noexcept { return outcome == Outcome::kApplied; }

  [[nodiscard]] static ApplyResult accept(common::TxKind kind, common::TxId tx, common::ClientId client) noexcept;
  [[nodiscard]] static ApplyResult reject(Outcome outcome, common::TxKind kind, common::TxId tx,
                                          common::ClientId client) noexcept;
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;
[[nodiscard]] std::uint16_t reject_code(Outcome outcome) noexcept;

// One-line human readable explanation, e.g. "transaction 7 is already under dispute".
[[nodiscard]] std::string describe(const ApplyResult& result);

}  // namespace ledger
}  // namespace paycore
