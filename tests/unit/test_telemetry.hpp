#pragma once

namespace solidcore::tests {

void test_latency_histogram();
void test_telemetry_sink();

}  // namespace solidcore::tests
