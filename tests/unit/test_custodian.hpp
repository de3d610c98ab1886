#pragma once

namespace solidcore::tests {

void test_reserve_custodian();

}  // namespace solidcore::tests
