#pragma once

namespace solidcore::tests {

void test_same_block_guard();
void test_reentrancy_guard();

}  // namespace solidcore::tests
