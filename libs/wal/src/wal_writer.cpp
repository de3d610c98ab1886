#include "solidcore/wal/wal_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace solidcore {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x5343574c;  // 'SCWL'

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

void fsync_file(std::FILE* file) {
  if (::fsync(::fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
}

class FileHandle {
 public:
  FileHandle(const std::filesystem::path& path, const char* mode)
      : file_(std::fopen(path.c_str(), mode)) {}
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  ~FileHandle() {
    if (file_) {
      std::fclose(file_);
    }
  }
  [[nodiscard]] std::FILE* get() const noexcept { return file_; }

 private:
  std::FILE* file_;
};

}  // namespace

ScanResult scan(const std::filesystem::path& path) {
  ScanResult result;
  if (!std::filesystem::exists(path)) {
    return result;
  }

  FileHandle file(path, "rb");
  if (!file.get()) {
    throw std::runtime_error("failed to open WAL for scan: " + path.string());
  }

  std::vector<std::byte> payload;
  while (true) {
    RecordHeader header;
    if (std::fread(&header, sizeof(RecordHeader), 1, file.get()) != 1) {
      break;
    }
    if (header.magic != kMagic) {
      throw std::runtime_error("invalid WAL magic in " + path.string());
    }
    payload.resize(header.payload_size);
    if (header.payload_size > 0 &&
        std::fread(payload.data(), 1, header.payload_size, file.get()) != header.payload_size) {
      break;
    }
    if (header.checksum != checksum32(payload)) {
      throw std::runtime_error("WAL checksum mismatch at sequence " +
                               std::to_string(header.sequence));
    }
    result.last_sequence = header.sequence;
    ++result.record_count;
    result.valid_bytes += sizeof(RecordHeader) + header.payload_size;
  }
  return result;
}

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open(path);
}

Writer::~Writer() {
  if (file_ && !buffer_.empty()) {
    // Best effort: a destructor cannot report a failed write; the unflushed tail is lost
    // exactly as if the process had stopped before flush().
    std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open(const std::filesystem::path& path) {
  const auto existing = scan(path);
  if (std::filesystem::exists(path) &&
      std::filesystem::file_size(path) > existing.valid_bytes) {
    std::filesystem::resize_file(path, existing.valid_bytes);
  }
  next_sequence_ = existing.last_sequence + 1;

  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open WAL file: " + path.string());
  }
}

std::uint64_t Writer::append(std::span<const std::byte> payload) {
  if (!file_) {
    throw std::runtime_error("WAL writer not open");
  }

  RecordHeader header;
  header.magic = kMagic;
  header.version = 1;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write WAL buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "WAL flush failed");
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  fsync_file(file_);
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open WAL for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto read_header = std::fread(&header, sizeof(RecordHeader), 1, file_);
  if (read_header != 1) {
    return false;
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid WAL magic in " + path_.string());
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated WAL record");
    }
  }

  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("WAL checksum mismatch");
  }

  return true;
}

}  // namespace wal
}  // namespace solidcore
