#include "solidcore/replay/replay_driver.hpp"

#include <stdexcept>
#include <utility>

#include "solidcore/wal/wal_writer.hpp"

namespace solidcore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_call_handler(CallHandler handler) {
  call_handler_ = std::move(handler);
}

ReplayStats Driver::execute() {
  if (!call_handler_) {
    throw std::runtime_error("call handler not set for replay");
  }

  ReplayStats stats;
  common::SequenceId resume_from{1};

  if (auto snap = snapshot_store_.latest()) {
    stats.snapshot_loaded = true;
    stats.snapshot_sequence = snap->sequence;
    stats.last_sequence = snap->sequence;
    resume_from = snap->sequence + 1;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload));
    }
  }

  if (wal_path_.empty() || !std::filesystem::exists(wal_path_)) {
    return stats;
  }

  wal::Reader reader(wal_path_);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence < resume_from) {
      continue;
    }
    const auto signed_call = ingest::decode_signed_call(record.payload);
    call_handler_(record.header.sequence, signed_call);
    ++stats.calls_replayed;
    stats.last_sequence = record.header.sequence;
  }
  return stats;
}

}  // namespace replay
}  // namespace solidcore
