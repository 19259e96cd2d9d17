#include "paycore/ledger/apply_result.hpp"

namespace paycore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeMalformedRecord = 1001;
constexpr std::uint16_t kRejectCodeDuplicateTransactionId = 1002;
constexpr std::uint16_t kRejectCodeUnknownReference = 1003;
constexpr std::uint16_t kRejectCodeOwnerMismatch = 1004;
constexpr std::uint16_t kRejectCodeInvalidStateTransition = 1005;
constexpr std::uint16_t kRejectCodeInsufficientFunds = 1006;
constexpr std::uint16_t kRejectCodeAccountLocked = 1007;
constexpr std::uint16_t kRejectCodeBalanceOverflow = 1008;
}  // namespace

ApplyResult ApplyResult::accept(common::TxKind kind, common::TxId tx, common::ClientId client) noexcept {
  return ApplyResult{.outcome = Outcome::kApplied, .reject_code = 0, .kind = kind, .tx = tx, .client = client};
}

ApplyResult ApplyResult::reject(Outcome outcome, common::TxKind kind, common::TxId tx,
                                common::ClientId client) noexcept {
  return ApplyResult{.outcome = outcome,
                     .reject_code = ledger::reject_code(outcome),
                     .kind = kind,
                     .tx = tx,
                     .client = client};
}

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "Applied";
    case Outcome::kRejectedMalformedRecord:
      return "MalformedRecord";
    case Outcome::kRejectedDuplicateTransactionId:
      return "DuplicateTransactionId";
    case Outcome::kRejectedUnknownReference:
      return "UnknownReference";
    case Outcome::kRejectedOwnerMismatch:
      return "OwnerMismatch";
    case Outcome::kRejectedInvalidStateTransition:
      return "InvalidStateTransition";
    case Outcome::kRejectedInsufficientFunds:
      return "InsufficientFunds";
    case Outcome::kRejectedAccountLocked:
      return "AccountLocked";
    case Outcome::kRejectedBalanceOverflow:
      return "BalanceOverflow";
  }
  return "Unknown";
}

std::uint16_t reject_code(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return 0;
    case Outcome::kRejectedMalformedRecord:
      return kRejectCodeMalformedRecord;
    case Outcome::kRejectedDuplicateTransactionId:
      return kRejectCodeDuplicateTransactionId;
    case Outcome::kRejectedUnknownReference:
      return kRejectCodeUnknownReference;
    case Outcome::kRejectedOwnerMismatch:
      return kRejectCodeOwnerMismatch;
    case Outcome::kRejectedInvalidStateTransition:
      return kRejectCodeInvalidStateTransition;
    case Outcome::kRejectedInsufficientFunds:
      return kRejectCodeInsufficientFunds;
    case Outcome::kRejectedAccountLocked:
      return kRejectCodeAccountLocked;
    case Outcome::kRejectedBalanceOverflow:
      return kRejectCodeBalanceOverflow;
  }
  return 0;
}

std::string describe(const ApplyResult& result) {
  const std::string tx = std::to_string(result.tx);
  const std::string client = std::to_string(result.client);

  switch (result.outcome) {
    case Outcome::kApplied:
      return std::string(common::to_string(result.kind)) + " " + tx + " applied";
    case Outcome::kRejectedMalformedRecord:
      return std::string(common::to_string(result.kind)) + " " + tx + " has a missing or invalid amount";
    case Outcome::kRejectedDuplicateTransactionId:
      return "transaction id " + tx + " has already been used";
    case Outcome::kRejectedUnknownReference:
      return "transaction " + tx + " does not refer to a known deposit";
    case Outcome::kRejectedOwnerMismatch:
      return "client " + client + " does not own transaction " + tx;
    case Outcome::kRejectedInvalidStateTransition:
      if (result.kind == common::TxKind::kDispute) {
        return "transaction " + tx + " is already under dispute";
      }
      return "transaction " + tx + " is not under dispute";
    case Outcome::kRejectedInsufficientFunds:
      return "client " + client + " does not have enough available funds for transaction " + tx;
    case Outcome::kRejectedAccountLocked:
      return "account " + client + " is locked";
    case Outcome::kRejectedBalanceOverflow:
      return "transaction " + tx + " would overflow the balance of client " + client;
  }
  return "transaction " + tx + " rejected";
}

}  // namespace ledger
}  // namespace paycore
