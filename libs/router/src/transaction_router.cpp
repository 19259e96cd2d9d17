#include "paycore/router/transaction_router.hpp"

namespace paycore {
namespace router {

using ledger::ApplyResult;
using ledger::Outcome;

ApplyResult TransactionRouter::route(ledger::Ledger& ledger, const common::TransactionRecord& record) const {
  if (common::CarriesAmount(record.kind) && !valid_amount(record)) {
    return ApplyResult::reject(Outcome::kRejectedMalformedRecord, record.kind, record.tx, record.client);
  }

  // A locked account processes nothing further, disputes included.
  if (const auto* account = ledger.find_account(record.client); account && account->locked) {
    return ApplyResult::reject(Outcome::kRejectedAccountLocked, record.kind, record.tx, record.client);
  }

  if (!common::CarriesAmount(record.kind)) {
    const auto* deposit = ledger.find_deposit(record.tx);
    if (!deposit) {
      return ApplyResult::reject(Outcome::kRejectedUnknownReference, record.kind, record.tx, record.client);
    }
    if (deposit->client != record.client) {
      return ApplyResult::reject(Outcome::kRejectedOwnerMismatch, record.kind, record.tx, record.client);
    }
  }

  switch (record.kind) {
    case common::TxKind::kDeposit:
      return ledger.deposit(record.client, record.tx, *record.amount);
    case common::TxKind::kWithdrawal:
      return ledger.withdraw(record.client, record.tx, *record.amount);
    case common::TxKind::kDispute:
      return ledger.dispute(record.client, record.tx);
    case common::TxKind::kResolve:
      return ledger.resolve(record.client, record.tx);
    case common::TxKind::kChargeback:
      return ledger.chargeback(record.client, record.tx);
  }

  return ApplyResult::reject(Outcome::kRejectedMalformedRecord, record.kind, record.tx, record.client);
}

bool TransactionRouter::valid_amount(const common::TransactionRecord& record) const {
  if (!record.amount.has_value() || record.amount->is_negative()) {
    return false;
  }
  return config_.allow_zero_amounts || !record.amount->is_zero();
}

}  // namespace router
}  // namespace paycore
