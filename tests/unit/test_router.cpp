#include "test_router.hpp"

#include <cassert>
#include "paycore/ledger/ledger.hpp"
#include "paycore/router/transaction_router.hpp"

namespace paycore::tests {

namespace {
using common::TxKind;
using ledger::Outcome;

common::TransactionRecord record(TxKind kind, common::ClientId client, common::TxId tx,
                                 std::optional<common::Amount> amount = std::nullopt) {
  return common::TransactionRecord{.kind = kind, .client = client, .tx = tx, .amount = amount};
}

common::Amount amt(const char* text) {
  return *common::Amount::parse(text);
}
}  // namespace

void test_router_validation_order() {
  ledger::Ledger ledger;
  router::TransactionRouter router;

  // Missing and negative amounts fail before anything else is looked at.
  assert(router.route(ledger, record(TxKind::kDeposit, 1, 1)).outcome == Outcome::kRejectedMalformedRecord);
  assert(router.route(ledger, record(TxKind::kWithdrawal, 1, 1, -amt("1"))).outcome ==
         Outcome::kRejectedMalformedRecord);
  assert(ledger.find_account(1) == nullptr);

  assert(router.route(ledger, record(TxKind::kDeposit, 1, 1, amt("3"))).applied());

  // References are checked for existence before their dispute state.
  assert(router.route(ledger, record(TxKind::kResolve, 1, 2)).outcome == Outcome::kRejectedUnknownReference);
  assert(router.route(ledger, record(TxKind::kResolve, 1, 1)).outcome ==
         Outcome::kRejectedInvalidStateTransition);

  // An amount on a dispute is not required and does not matter.
  assert(router.route(ledger, record(TxKind::kDispute, 1, 1, amt("999"))).applied());
  assert(ledger.find_account(1)->held == amt("3"));
  assert(router.route(ledger, record(TxKind::kDispute, 1, 1)).outcome ==
         Outcome::kRejectedInvalidStateTransition);
  assert(router.route(ledger, record(TxKind::kResolve, 1, 1)).applied());
  assert(ledger.find_account(1)->available == amt("3"));
}

void test_router_owner_mismatch() {
  ledger::Ledger ledger;
  router::TransactionRouter router;
  assert(router.route(ledger, record(TxKind::kDeposit, 1, 1, amt("10"))).applied());
  assert(router.route(ledger, record(TxKind::kDeposit, 2, 2, amt("4"))).applied());

  for (const auto kind : {TxKind::kDispute, TxKind::kResolve, TxKind::kChargeback}) {
    const auto result = router.route(ledger, record(kind, 2, 1));
    assert(result.outcome == Outcome::kRejectedOwnerMismatch);
    assert(result.client == 2);
    assert(result.tx == 1);
  }

  // Neither the stored owner nor the claimant changed.
  assert(ledger.find_account(1)->available == amt("10"));
  assert(ledger.find_account(1)->held == amt("0"));
  assert(ledger.find_account(2)->available == amt("4"));
  assert(ledger.find_deposit(1)->dispute_state == ledger::DisputeState::kClean);

  // A claimant with no account at all is not materialised.
  assert(router.route(ledger, record(TxKind::kDispute, 3, 1)).outcome == Outcome::kRejectedOwnerMismatch);
  assert(ledger.find_account(3) == nullptr);
}

void test_router_locked_account() {
  ledger::Ledger ledger;
  router::TransactionRouter router;
  assert(router.route(ledger, record(TxKind::kDeposit, 9, 1, amt("5"))).applied());
  assert(router.route(ledger, record(TxKind::kDeposit, 9, 2, amt("5"))).applied());
  assert(router.route(ledger, record(TxKind::kDispute, 9, 1)).applied());
  assert(router.route(ledger, record(TxKind::kDispute, 9, 2)).applied());
  assert(router.route(ledger, record(TxKind::kChargeback, 9, 1)).applied());

  const auto before = *ledger.find_account(9);
  assert(before.locked);

  // Locked wins over every other check, including an otherwise valid resolve.
  assert(router.route(ledger, record(TxKind::kResolve, 9, 2)).outcome == Outcome::kRejectedAccountLocked);
  assert(router.route(ledger, record(TxKind::kChargeback, 9, 2)).outcome == Outcome::kRejectedAccountLocked);
  assert(router.route(ledger, record(TxKind::kDeposit, 9, 3, amt("1"))).outcome ==
         Outcome::kRejectedAccountLocked);
  assert(router.route(ledger, record(TxKind::kWithdrawal, 9, 4, amt("1"))).outcome ==
         Outcome::kRejectedAccountLocked);
  assert(router.route(ledger, record(TxKind::kDispute, 9, 77)).outcome == Outcome::kRejectedAccountLocked);

  const auto after = *ledger.find_account(9);
  assert(after.available == before.available);
  assert(after.held == before.held);
  assert(after.held == amt("5"));
  assert(after.total() == amt("5"));
}

void test_router_zero_amounts() {
  ledger::Ledger ledger;
  router::TransactionRouter permissive;
  assert(permissive.route(ledger, record(TxKind::kDeposit, 1, 1, amt("0"))).applied());
  assert(ledger.find_account(1)->total() == amt("0"));

  router::TransactionRouter strict{{.allow_zero_amounts = false}};
  assert(strict.route(ledger, record(TxKind::kDeposit, 1, 2, amt("0"))).outcome ==
         Outcome::kRejectedMalformedRecord);
  assert(strict.route(ledger, record(TxKind::kWithdrawal, 1, 3, amt("0.0000"))).outcome ==
         Outcome::kRejectedMalformedRecord);
  assert(strict.route(ledger, record(TxKind::kDeposit, 1, 4, amt("0.0001"))).applied());
}

}  // namespace paycore::tests
