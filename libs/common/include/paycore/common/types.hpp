#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "paycore/common/amount.hpp"

namespace paycore {
namespace common {

using ClientId = std::uint16_t;
using TxId = std::uint32_t;

enum class TxKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Deposits and withdrawals carry an amount; the other kinds reference a prior deposit.
inline constexpr bool CarriesAmount(TxKind kind) noexcept {
  return kind == TxKind::kDeposit || kind == TxKind::kWithdrawal;
}

inline constexpr std::string_view to_string(TxKind kind) noexcept {
  switch (kind) {
    case TxKind::kDeposit:
      return "deposit";
    case TxKind::kWithdrawal:
      return "withdrawal";
    case TxKind::kDispute:
      return "dispute";
    case TxKind::kResolve:
      return "resolve";
    case TxKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

struct TransactionRecord {
  TxKind kind{TxKind::kDeposit};
  ClientId client{0};
  TxId tx{0};
  std::optional<Amount> amount{};
};

}  // namespace common
}  // namespace paycore
