#include "solidcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>

namespace solidcore {
namespace telemetry {

namespace {

// bucket[i] covers [2^(i-1), 2^i)
std::size_t bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), LatencyHistogram::kNumBuckets - 1);
}

double bucket_upper_bound(std::size_t idx) noexcept {
  return static_cast<double>(std::uint64_t{1} << idx);
}

}  // namespace

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

void LatencyHistogram::reset() noexcept {
  buckets_.fill(0);
  count_ = 0;
  sum_ = 0;
  max_ = 0;
}

double LatencyHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  const auto target = static_cast<std::uint64_t>(static_cast<double>(count_) * p);
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target && cumulative > 0) {
      return std::min(bucket_upper_bound(idx), static_cast<double>(max_));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::record_call(std::uint8_t kind, bool accepted,
                                std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  auto& stats = kinds_[kind % kMaxKinds];
  if (accepted) {
    ++stats.accepted;
  } else {
    ++stats.rejected;
  }
  stats.latency.record(latency.count());
}

void TelemetrySink::record_rejection(std::uint16_t code) {
  std::scoped_lock lock(mutex_);
  ++rejections_[code];
}

std::uint64_t TelemetrySink::accepted(std::uint8_t kind) const {
  std::scoped_lock lock(mutex_);
  return kinds_[kind % kMaxKinds].accepted;
}

std::uint64_t TelemetrySink::rejected(std::uint8_t kind) const {
  std::scoped_lock lock(mutex_);
  return kinds_[kind % kMaxKinds].rejected;
}

std::uint64_t TelemetrySink::rejections(std::uint16_t code) const {
  std::scoped_lock lock(mutex_);
  if (auto it = rejections_.find(code); it != rejections_.end()) {
    return it->second;
  }
  return 0;
}

std::map<std::uint16_t, std::uint64_t> TelemetrySink::rejection_counts() const {
  std::scoped_lock lock(mutex_);
  return rejections_;
}

std::vector<CallSummary> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  std::vector<CallSummary> summaries;

  for (std::size_t idx = 0; idx < kMaxKinds; ++idx) {
    auto& stats = kinds_[idx];
    if (stats.accepted == 0 && stats.rejected == 0) {
      continue;
    }

    summaries.push_back(CallSummary{
        .kind = static_cast<std::uint8_t>(idx),
        .accepted = stats.accepted,
        .rejected = stats.rejected,
        .mean_ns = stats.latency.mean(),
        .p99_ns = stats.latency.percentile(0.99),
    });

    stats = KindStats{};
  }
  rejections_.clear();

  return summaries;
}

}  // namespace telemetry
}  // namespace solidcore
