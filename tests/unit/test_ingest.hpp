#pragma once

namespace solidcore::tests {

void test_call_codec();
void test_call_dispatcher();
void test_call_script();

}  // namespace solidcore::tests
