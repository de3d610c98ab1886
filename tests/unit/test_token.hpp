#pragma once

namespace solidcore::tests {

void test_event_log();
void test_token_provision();
void test_token_transfers();
void test_token_pool_trading();
void test_token_value_retrieval();
void test_token_reentrancy();
void test_token_conservation_walk();

}  // namespace solidcore::tests
