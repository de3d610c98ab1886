#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace solidcore {
namespace telemetry {

// log2-bucketed latency histogram, 1ns to ~1s.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 31;

  void record(std::int64_t value_ns) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};
};

struct CallSummary {
  std::uint8_t kind{0};
  std::uint64_t accepted{0};
  std::uint64_t rejected{0};
  double mean_ns{0.0};
  double p99_ns{0.0};
};

// Outcome counters per call kind and per rejection code.
class TelemetrySink {
 public:
  static constexpr std::size_t kMaxKinds = 16;

  void record_call(std::uint8_t kind, bool accepted, std::chrono::nanoseconds latency);
  void record_rejection(std::uint16_t code);

  [[nodiscard]] std::uint64_t accepted(std::uint8_t kind) const;
  [[nodiscard]] std::uint64_t rejected(std::uint8_t kind) const;
  [[nodiscard]] std::uint64_t rejections(std::uint16_t code) const;
  [[nodiscard]] std::map<std::uint16_t, std::uint64_t> rejection_counts() const;

  // Summaries for every kind seen since the last drain; resets the counters.
  [[nodiscard]] std::vector<CallSummary> drain();

 private:
  struct KindStats {
    std::uint64_t accepted{0};
    std::uint64_t rejected{0};
    LatencyHistogram latency{};
  };

  mutable std::mutex mutex_;
  std::array<KindStats, kMaxKinds> kinds_{};
  std::map<std::uint16_t, std::uint64_t> rejections_{};
};

}  // namespace telemetry
}  // namespace solidcore
