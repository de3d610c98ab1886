#pragma once

namespace solidcore::tests {

void test_ledger_update();
void test_ledger_allowances();
void test_ledger_rollback();

}  // namespace solidcore::tests
