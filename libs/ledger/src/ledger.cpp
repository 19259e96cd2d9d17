#include "paycore/ledger/ledger.hpp"

#include <algorithm>
#include <optional>

namespace paycore {
namespace ledger {

namespace {
using common::Amount;
using common::TxKind;
}  // namespace

ApplyResult Ledger::deposit(common::ClientId client, common::TxId tx, Amount amount) {
  if (amount.is_negative()) {
    return ApplyResult::reject(Outcome::kRejectedMalformedRecord, TxKind::kDeposit, tx, client);
  }

  const Account* existing = find_account(client);
  if (existing && existing->locked) {
    return ApplyResult::reject(Outcome::kRejectedAccountLocked, TxKind::kDeposit, tx, client);
  }
  if (has_transaction(tx)) {
    return ApplyResult::reject(Outcome::kRejectedDuplicateTransactionId, TxKind::kDeposit, tx, client);
  }

  const Amount available = existing ? existing->available : Amount::zero();
  const Amount total = existing ? existing->total() : Amount::zero();
  const auto new_available = Amount::checked_add(available, amount);
  if (!new_available || !Amount::checked_add(total, amount)) {
    return ApplyResult::reject(Outcome::kRejectedBalanceOverflow, TxKind::kDeposit, tx, client);
  }

  ensure_account(client).available = *new_available;
  deposits_.emplace(tx, StoredDeposit{.client = client, .amount = amount, .dispute_state = DisputeState::kClean});
  return ApplyResult::accept(TxKind::kDeposit, tx, client);
}

ApplyResult Ledger::withdraw(common::ClientId client, common::TxId tx, Amount amount) {
  if (amount.is_negative()) {
    return ApplyResult::reject(Outcome::kRejectedMalformedRecord, TxKind::kWithdrawal, tx, client);
  }

  const Account* existing = find_account(client);
  if (existing && existing->locked) {
    return ApplyResult::reject(Outcome::kRejectedAccountLocked, TxKind::kWithdrawal, tx, client);
  }
  if (has_transaction(tx)) {
    return ApplyResult::reject(Outcome::kRejectedDuplicateTransactionId, TxKind::kWithdrawal, tx, client);
  }

  const Amount available = existing ? existing->available : Amount::zero();
  if (available < amount) {
    return ApplyResult::reject(Outcome::kRejectedInsufficientFunds, TxKind::kWithdrawal, tx, client);
  }

  ensure_account(client).available -= amount;
  withdrawals_.insert(tx);
  return ApplyResult::accept(TxKind::kWithdrawal, tx, client);
}

ApplyResult Ledger::dispute(common::ClientId client, common::TxId tx) {
  Account* account = nullptr;
  StoredDeposit* deposit = nullptr;
  if (auto located = locate_disputable(TxKind::kDispute, client, tx, &account, &deposit); !located.applied()) {
    return located;
  }
  if (deposit->dispute_state != DisputeState::kClean) {
    return ApplyResult::reject(Outcome::kRejectedInvalidStateTransition, TxKind::kDispute, tx, client);
  }

  const auto new_held = Amount::checked_add(account->held, deposit->amount);
  const auto new_available = Amount::checked_add(account->available, -deposit->amount);
  if (!new_held || !new_available) {
    return ApplyResult::reject(Outcome::kRejectedBalanceOverflow, TxKind::kDispute, tx, client);
  }

  account->available = *new_available;
  account->held = *new_held;
  deposit->dispute_state = DisputeState::kDisputed;
  return ApplyResult::accept(TxKind::kDispute, tx, client);
}

ApplyResult Ledger::resolve(common::ClientId client, common::TxId tx) {
  Account* account = nullptr;
  StoredDeposit* deposit = nullptr;
  if (auto located = locate_disputable(TxKind::kResolve, client, tx, &account, &deposit); !located.applied()) {
    return located;
  }
  if (deposit->dispute_state != DisputeState::kDisputed) {
    return ApplyResult::reject(Outcome::kRejectedInvalidStateTransition, TxKind::kResolve, tx, client);
  }

  const auto new_available = Amount::checked_add(account->available, deposit->amount);
  if (!new_available) {
    return ApplyResult::reject(Outcome::kRejectedBalanceOverflow, TxKind::kResolve, tx, client);
  }

  account->available = *new_available;
  account->held -= deposit->amount;
  deposit->dispute_state = DisputeState::kClean;
  return ApplyResult::accept(TxKind::kResolve, tx, client);
}

ApplyResult Ledger::chargeback(common::ClientId client, common::TxId tx) {
  Account* account = nullptr;
  StoredDeposit* deposit = nullptr;
  if (auto located = locate_disputable(TxKind::kChargeback, client, tx, &account, &deposit); !located.applied()) {
    return located;
  }
  if (deposit->dispute_state != DisputeState::kDisputed) {
    return ApplyResult::reject(Outcome::kRejectedInvalidStateTransition, TxKind::kChargeback, tx, client);
  }

  // The disputed funds leave the account for good; available keeps whatever
  // the client already spent.
  account->held -= deposit->amount;
  account->locked = true;
  deposit->dispute_state = DisputeState::kClean;
  return ApplyResult::accept(TxKind::kChargeback, tx, client);
}

const Account* Ledger::find_account(common::ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

const StoredDeposit* Ledger::find_deposit(common::TxId tx) const {
  auto it = deposits_.find(tx);
  if (it == deposits_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool Ledger::has_transaction(common::TxId tx) const {
  return deposits_.contains(tx) || withdrawals_.contains(tx);
}

std::vector<AccountSnapshot> Ledger::snapshot(SnapshotOrder order) const {
  std::vector<AccountSnapshot> result;
  result.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    result.push_back(AccountSnapshot{
        .client = client,
        .available = account.available,
        .held = account.held,
        .total = account.total(),
        .locked = account.locked,
    });
  }

  if (order == SnapshotOrder::kByClient) {
    std::sort(result.begin(), result.end(), [](const AccountSnapshot& lhs, const AccountSnapshot& rhs) {
      return lhs.client < rhs.client;
    });
  }
  return result;
}

Account& Ledger::ensure_account(common::ClientId client) {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    it = accounts_.emplace(client, Account{.client = client}).first;
  }
  return it->second;
}

Account* Ledger::find_account_mut(common::ClientId client) {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

ApplyResult Ledger::locate_disputable(TxKind kind, common::ClientId client, common::TxId tx,
                                      Account** out_account, StoredDeposit** out_deposit) {
  Account* account = find_account_mut(client);
  if (account && account->locked) {
    return ApplyResult::reject(Outcome::kRejectedAccountLocked, kind, tx, client);
  }

  auto it = deposits_.find(tx);
  if (it == deposits_.end()) {
    return ApplyResult::reject(Outcome::kRejectedUnknownReference, kind, tx, client);
  }
  if (it->second.client != client) {
    return ApplyResult::reject(Outcome::kRejectedOwnerMismatch, kind, tx, client);
  }
  // A stored deposit implies its owner's account exists.
  if (!account) {
    return ApplyResult::reject(Outcome::kRejectedUnknownReference, kind, tx, client);
  }

  *out_account = account;
  *out_deposit = &it->second;
  return ApplyResult::accept(kind, tx, client);
}

}  // namespace ledger
}  // namespace paycore
