#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>

#include "solidcore/common/types.hpp"
#include "solidcore/ingest/call.hpp"
#include "solidcore/snapshot/snapshot_store.hpp"

namespace solidcore {
namespace replay {

struct ReplayStats {
  bool snapshot_loaded{false};
  common::SequenceId snapshot_sequence{0};
  std::uint64_t calls_replayed{0};
  common::SequenceId last_sequence{0};
};

// Restores the latest snapshot, then feeds every later WAL record, decoded, to the call
// handler in sequence order.
class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using CallHandler = std::function<void(common::SequenceId, const ingest::SignedCall&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_call_handler(CallHandler handler);
  ReplayStats execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  CallHandler call_handler_{};
};

}  // namespace replay
}  // namespace solidcore
