#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "solidcore/common/types.hpp"

namespace solidcore {
namespace snapshot {

struct SnapshotRecord {
  common::SequenceId sequence{0};  // last WAL sequence folded into the payload
  std::vector<std::byte> payload{};
};

// Append-only snapshot file; the last complete record wins.
class Store {
 public:
  Store();
  explicit Store(std::filesystem::path directory);

  void prepare(const std::filesystem::path& directory);
  void persist(common::SequenceId sequence_id, std::span<const std::byte> payload);
  [[nodiscard]] std::optional<SnapshotRecord> latest() const;
  [[nodiscard]] std::size_t record_count() const;
  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }
  [[nodiscard]] const std::filesystem::path& file_path() const noexcept { return file_path_; }

 private:
  std::filesystem::path directory_{};
  std::filesystem::path file_path_{};

  template <typename Visitor>
  void for_each_record(Visitor&& visit) const;
};

}  // namespace snapshot
}  // namespace solidcore
