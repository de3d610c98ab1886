#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace solidcore {
namespace wal {

struct RecordHeader {
  std::uint32_t magic{0x5343574c};      // 'SCWL'
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

struct ScanResult {
  std::uint64_t last_sequence{0};
  std::uint64_t record_count{0};
  std::uintmax_t valid_bytes{0};
};

// Walks the log up to the first incomplete record. Bad magic or a checksum mismatch in a
// complete record still throws.
ScanResult scan(const std::filesystem::path& path);

class Writer {
 public:
  // Opens (or creates) the log. A torn record left by an interrupted append is cut off.
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 16);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(std::span<const std::byte> payload);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] std::uint64_t last_sequence() const noexcept { return next_sequence_ - 1; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // Returns false at the end of the log. Throws on corruption or a truncated record.
  bool next(Record& out_record);

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
};

}  // namespace wal
}  // namespace solidcore
