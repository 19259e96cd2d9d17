#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"
#include "paycore/ledger/apply_result.hpp"

namespace paycore {
namespace ledger {

struct Account {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  bool locked{false};

  [[nodiscard]] common::Amount total() const noexcept { return available + held; }
};

enum class DisputeState : std::uint8_t {
  kClean,
  kDisputed,
};

struct StoredDeposit {
  common::ClientId client{0};
  common::Amount amount{};
  DisputeState dispute_state{DisputeState::kClean};
};

struct AccountSnapshot {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

enum class SnapshotOrder : std::uint8_t {
  kUnordered,
  kByClient,
};

// Account balances and deposit history for one run. Every mutation either
// applies completely or returns a rejection and leaves the ledger untouched.
// Accounts appear on the first applied deposit or withdrawal for a client.
class Ledger {
 public:
  [[nodiscard]] ApplyResult deposit(common::ClientId client, common::TxId tx, common::Amount amount);
  [[nodiscard]] ApplyResult withdraw(common::ClientId client, common::TxId tx, common::Amount amount);
  [[nodiscard]] ApplyResult dispute(common::ClientId client, common::TxId tx);
  [[nodiscard]] ApplyResult resolve(common::ClientId client, common::TxId tx);
  [[nodiscard]] ApplyResult chargeback(common::ClientId client, common::TxId tx);

  [[nodiscard]] const Account* find_account(common::ClientId client) const;
  [[nodiscard]] const StoredDeposit* find_deposit(common::TxId tx) const;
  [[nodiscard]] bool has_transaction(common::TxId tx) const;

  [[nodiscard]] std::vector<AccountSnapshot> snapshot(SnapshotOrder order = SnapshotOrder::kByClient) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::size_t deposit_count() const noexcept { return deposits_.size(); }

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
  std::unordered_map<common::TxId, StoredDeposit> deposits_{};
  std::unordered_set<common::TxId> withdrawals_{};

  Account& ensure_account(common::ClientId client);
  Account* find_account_mut(common::ClientId client);

  // Shared lookup for dispute/resolve/chargeback; on success *out_account and
  // *out_deposit point at the live entries.
  ApplyResult locate_disputable(common::TxKind kind, common::ClientId client, common::TxId tx,
                                Account** out_account, StoredDeposit** out_deposit);
};

}  // namespace ledger
}  // namespace paycore
