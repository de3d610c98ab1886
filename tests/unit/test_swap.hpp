#pragma once

namespace solidcore::tests {

void test_swap_quotes();

}  // namespace solidcore::tests
