#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "solidcore/common/types.hpp"

namespace solidcore {
namespace common {

// Converts between host order and little-endian in place.
template <std::size_t N>
void to_little_endian(std::array<std::byte, N>& raw) noexcept {
  if constexpr (std::endian::native == std::endian::big) {
    std::reverse(raw.begin(), raw.end());
  }
}

// Fixed-layout little-endian encoding shared by the call codec and the state snapshot.
class ByteWriter {
 public:
  template <typename T>
  void put(T value) {
    auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
    to_little_endian(raw);
    buffer_.insert(buffer_.end(), raw.begin(), raw.end());
  }

  void put(const Address& address) {
    const auto* first = reinterpret_cast<const std::byte*>(address.bytes.data());
    buffer_.insert(buffer_.end(), first, first + Address::kSize);
  }

  void put_bytes(std::span<const std::byte> bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
  }

  [[nodiscard]] const std::vector<std::byte>& bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<std::byte> take() noexcept { return std::move(buffer_); }

 private:
  std::vector<std::byte> buffer_{};
};

class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> data) noexcept : data_(data) {}

  template <typename T>
  T get() {
    require(sizeof(T));
    std::array<std::byte, sizeof(T)> storage{};
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), sizeof(T), storage.begin());
    offset_ += sizeof(T);
    to_little_endian(storage);
    return std::bit_cast<T>(storage);
  }

  Address get_address() {
    require(Address::kSize);
    Address address;
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), Address::kSize,
                reinterpret_cast<std::byte*>(address.bytes.data()));
    offset_ += Address::kSize;
    return address;
  }

  void get_bytes(std::span<std::byte> out) {
    require(out.size());
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), out.size(), out.begin());
    offset_ += out.size();
  }

  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
  [[nodiscard]] bool exhausted() const noexcept { return offset_ == data_.size(); }

 private:
  std::span<const std::byte> data_;
  std::size_t offset_{0};

  void require(std::size_t size) const {
    if (offset_ + size > data_.size()) {
      throw std::runtime_error("decode out of bounds at offset " + std::to_string(offset_));
    }
  }
};

}  // namespace common
}  // namespace solidcore
