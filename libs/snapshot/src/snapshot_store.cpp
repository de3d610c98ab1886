#include "solidcore/snapshot/snapshot_store.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace solidcore {
namespace snapshot {

namespace {
constexpr std::uint32_t kMagic = 0x5343534e;  // 'SCSN'
constexpr std::uint16_t kVersion = 1;

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= 16777619u;
  }
  return hash;
}

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory) {
  prepare(std::move(directory));
}

void Store::prepare(const std::filesystem::path& directory) {
  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }
  directory_ = directory;
  file_path_ = directory_ / "snapshot.sc";
}

void Store::persist(common::SequenceId sequence_id, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  std::ofstream out(file_path_, std::ios::binary | std::ios::app);
  if (!out) {
    throw std::runtime_error("failed to open snapshot file for write: " + file_path_.string());
  }

  SnapshotHeader header;
  header.sequence = sequence_id;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  out.write(reinterpret_cast<const char*>(&header), sizeof(header));
  if (!payload.empty()) {
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write snapshot record to " + file_path_.string());
  }
}

template <typename Visitor>
void Store::for_each_record(Visitor&& visit) const {
  if (file_path_.empty() || !std::filesystem::exists(file_path_)) {
    return;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + file_path_.string());
  }

  SnapshotHeader header;
  SnapshotRecord record;
  while (in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    if (header.magic != kMagic) {
      throw std::runtime_error("invalid snapshot magic");
    }
    if (header.version != kVersion) {
      throw std::runtime_error("unsupported snapshot version " + std::to_string(header.version));
    }
    record.sequence = header.sequence;
    record.payload.resize(header.payload_size);
    if (header.payload_size > 0) {
      in.read(reinterpret_cast<char*>(record.payload.data()),
              static_cast<std::streamsize>(header.payload_size));
      if (!in) {
        // A record cut short by a crash during persist(); earlier records stay valid.
        return;
      }
    }
    if (header.checksum != checksum32(record.payload)) {
      throw std::runtime_error("snapshot checksum mismatch at sequence " +
                               std::to_string(header.sequence));
    }
    visit(record);
  }
}

std::optional<SnapshotRecord> Store::latest() const {
  std::optional<SnapshotRecord> result;
  for_each_record([&](const SnapshotRecord& record) { result = record; });
  return result;
}

std::size_t Store::record_count() const {
  std::size_t count = 0;
  for_each_record([&](const SnapshotRecord&) { ++count; });
  return count;
}

}  // namespace snapshot
}  // namespace solidcore
