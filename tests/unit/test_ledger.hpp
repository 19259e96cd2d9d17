#pragma once

namespace paycore::tests {

void test_ledger_deposit_withdraw();
void test_ledger_dispute_lifecycle();
void test_ledger_rejections();
void test_ledger_snapshot_order();

}  // namespace paycore::tests
