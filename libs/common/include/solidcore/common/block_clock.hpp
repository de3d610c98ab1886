#pragma once

#include "solidcore/common/types.hpp"

namespace solidcore {
namespace common {

class BlockClock {
 public:
  virtual ~BlockClock() = default;
  [[nodiscard]] virtual BlockNumber current() const noexcept = 0;
};

// Deterministic clock for tests and for replaying recorded calls.
class ManualBlockClock final : public BlockClock {
 public:
  explicit ManualBlockClock(BlockNumber start = 1) noexcept : block_(start) {}

  [[nodiscard]] BlockNumber current() const noexcept override { return block_; }
  void set(BlockNumber block) noexcept { block_ = block; }
  void advance(BlockNumber blocks = 1) noexcept { block_ += blocks; }

 private:
  BlockNumber block_;
};

}  // namespace common
}  // namespace solidcore
