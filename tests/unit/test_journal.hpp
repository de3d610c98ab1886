#pragma once

namespace solidcore::tests {

void test_journal_rollback();
void test_journal_nested_scopes();

}  // namespace solidcore::tests
