#include "test_ledger.hpp"

#include <cassert>
#include <limits>
#include "paycore/ledger/ledger.hpp"

namespace paycore::tests {

namespace {
common::Amount amt(const char* text) {
  return *common::Amount::parse(text);
}
}  // namespace

void test_ledger_deposit_withdraw() {
  ledger::Ledger ledger;
  assert(ledger.deposit(7, 1, amt("100")).applied());
  assert(ledger.withdraw(7, 2, amt("10.5")).applied());

  const auto* account = ledger.find_account(7);
  assert(account != nullptr);
  assert(account->available == amt("89.5"));
  assert(account->held == amt("0"));
  assert(account->total() == amt("89.5"));
  assert(!account->locked);

  // Withdrawals are not kept as disputable history.
  assert(ledger.find_deposit(1) != nullptr);
  assert(ledger.find_deposit(2) == nullptr);
  assert(ledger.deposit_count() == 1);
  assert(ledger.has_transaction(2));

  // Withdrawing exactly the available balance is allowed.
  assert(ledger.withdraw(7, 3, amt("89.5")).applied());
  assert(ledger.find_account(7)->available == amt("0"));
}

void test_ledger_dispute_lifecycle() {
  ledger::Ledger ledger;
  assert(ledger.deposit(1, 10, amt("20")).applied());
  assert(ledger.deposit(1, 11, amt("5")).applied());

  assert(ledger.dispute(1, 10).applied());
  assert(ledger.find_deposit(10)->dispute_state == ledger::DisputeState::kDisputed);
  assert(ledger.find_account(1)->available == amt("5"));
  assert(ledger.find_account(1)->held == amt("20"));
  assert(ledger.find_account(1)->total() == amt("25"));

  assert(ledger.resolve(1, 10).applied());
  assert(ledger.find_deposit(10)->dispute_state == ledger::DisputeState::kClean);
  assert(ledger.find_account(1)->available == amt("25"));
  assert(ledger.find_account(1)->held == amt("0"));

  // A resolved deposit can be disputed again.
  assert(ledger.dispute(1, 10).applied());
  assert(ledger.withdraw(1, 12, amt("5")).applied());
  assert(ledger.chargeback(1, 10).applied());

  const auto* account = ledger.find_account(1);
  assert(account->locked);
  assert(account->available == amt("0"));
  assert(account->held == amt("0"));
  assert(account->total() == amt("0"));
  assert(ledger.find_deposit(10)->dispute_state == ledger::DisputeState::kClean);
}

void test_ledger_rejections() {
  ledger::Ledger ledger;
  assert(ledger.deposit(1, 1, amt("2")).applied());

  auto duplicate = ledger.deposit(1, 1, amt("3"));
  assert(duplicate.outcome == ledger::Outcome::kRejectedDuplicateTransactionId);
  assert(duplicate.reject_code == 1002);

  assert(ledger.withdraw(1, 2, amt("1")).applied());
  assert(ledger.deposit(1, 2, amt("1")).outcome == ledger::Outcome::kRejectedDuplicateTransactionId);
  assert(ledger.withdraw(1, 1, amt("1")).outcome == ledger::Outcome::kRejectedDuplicateTransactionId);

  auto insufficient = ledger.withdraw(1, 3, amt("1.0001"));
  assert(insufficient.outcome == ledger::Outcome::kRejectedInsufficientFunds);
  // A rejected withdrawal does not consume its id.
  assert(ledger.withdraw(1, 3, amt("1")).applied());

  assert(ledger.dispute(1, 2).outcome == ledger::Outcome::kRejectedUnknownReference);
  assert(ledger.dispute(1, 99).outcome == ledger::Outcome::kRejectedUnknownReference);
  assert(ledger.dispute(2, 1).outcome == ledger::Outcome::kRejectedOwnerMismatch);
  assert(ledger.resolve(1, 1).outcome == ledger::Outcome::kRejectedInvalidStateTransition);
  assert(ledger.chargeback(1, 1).outcome == ledger::Outcome::kRejectedInvalidStateTransition);
  assert(ledger.deposit(1, 4, -amt("1")).outcome == ledger::Outcome::kRejectedMalformedRecord);

  // Nothing above touched client 2.
  assert(ledger.find_account(2) == nullptr);

  assert(ledger.deposit(1, 8, amt("1")).applied());
  const auto huge = common::Amount::from_units(std::numeric_limits<std::int64_t>::max());
  assert(ledger.deposit(1, 5, huge).outcome == ledger::Outcome::kRejectedBalanceOverflow);
  assert(ledger.find_deposit(5) == nullptr);

  // Disputing more than is available drives available negative.
  assert(ledger.dispute(1, 1).applied());
  assert(ledger.find_account(1)->available == -amt("1"));
  assert(ledger.chargeback(1, 1).applied());
  assert(ledger.find_account(1)->total() == -amt("1"));
  assert(ledger.deposit(1, 6, amt("1")).outcome == ledger::Outcome::kRejectedAccountLocked);
  assert(ledger.withdraw(1, 7, amt("0")).outcome == ledger::Outcome::kRejectedAccountLocked);
  assert(ledger.dispute(1, 1).outcome == ledger::Outcome::kRejectedAccountLocked);
}

void test_ledger_snapshot_order() {
  ledger::Ledger ledger;
  assert(ledger.deposit(30, 1, amt("1")).applied());
  assert(ledger.deposit(2, 2, amt("2")).applied());
  assert(ledger.deposit(17, 3, amt("3")).applied());
  assert(ledger.dispute(17, 3).applied());

  const auto sorted = ledger.snapshot(ledger::SnapshotOrder::kByClient);
  assert(sorted.size() == 3);
  assert(sorted[0].client == 2);
  assert(sorted[1].client == 17);
  assert(sorted[2].client == 30);
  assert(sorted[1].available == amt("0"));
  assert(sorted[1].held == amt("3"));
  assert(sorted[1].total == amt("3"));

  assert(ledger.snapshot(ledger::SnapshotOrder::kUnordered).size() == 3);
}

}  // namespace paycore::tests
