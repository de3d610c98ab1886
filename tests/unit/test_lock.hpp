#pragma once

namespace solidcore::tests {

void test_liquidity_lock_lifecycle();
void test_liquidity_lock_rejections();
void test_liquidity_lock_reentrancy();

}  // namespace solidcore::tests
