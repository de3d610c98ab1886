#include "test_telemetry.hpp"

#include <cassert>
#include <chrono>

#include "solidcore/telemetry/telemetry_sink.hpp"

namespace solidcore::tests {

void test_latency_histogram() {
  telemetry::LatencyHistogram histogram;
  assert(histogram.count() == 0);
  assert(histogram.mean() == 0.0);
  assert(histogram.percentile(0.99) == 0.0);

  for (int i = 0; i < 100; ++i) {
    histogram.record(100);
  }
  assert(histogram.count() == 100);
  assert(histogram.mean() == 100.0);
  // The bucket bound (128) is capped by the observed maximum.
  assert(histogram.percentile(0.99) == 100.0);

  histogram.record(10'000);
  assert(histogram.percentile(1.0) == 10'000.0);

  histogram.reset();
  assert(histogram.count() == 0);
}

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  sink.record_call(1, true, std::chrono::nanoseconds{200});
  sink.record_call(1, false, std::chrono::nanoseconds{300});
  sink.record_call(6, true, std::chrono::nanoseconds{50});
  sink.record_rejection(3101);
  sink.record_rejection(3101);
  sink.record_rejection(3001);

  assert(sink.accepted(1) == 1);
  assert(sink.rejected(1) == 1);
  assert(sink.accepted(6) == 1);
  assert(sink.rejections(3101) == 2);
  assert(sink.rejections(3002) == 0);
  assert(sink.rejection_counts().size() == 2);

  const auto summaries = sink.drain();
  assert(summaries.size() == 2);
  assert(summaries[0].kind == 1);
  assert(summaries[0].accepted == 1);
  assert(summaries[0].rejected == 1);
  assert(summaries[0].mean_ns == 250.0);
  assert(summaries[1].kind == 6);

  assert(sink.accepted(1) == 0);
  assert(sink.rejection_counts().empty());
  assert(sink.drain().empty());
}

}  // namespace solidcore::tests
