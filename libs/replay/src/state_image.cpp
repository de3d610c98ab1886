#include "solidcore/replay/state_image.hpp"

#include <stdexcept>

#include "solidcore/common/byte_codec.hpp"

namespace solidcore {
namespace replay {

namespace {
constexpr std::uint32_t kImageVersion = 1;
}

std::vector<std::byte> capture(const StateRefs& state) {
  common::ByteWriter out;
  out.put<std::uint32_t>(kImageVersion);
  out.put<common::BlockNumber>(state.clock.current());
  state.bank.save(out);
  state.token.save(out);
  out.put<std::uint8_t>(state.liquidity_lock ? 1 : 0);
  if (state.liquidity_lock) {
    state.liquidity_lock->save(out);
  }
  return out.take();
}

void restore(const StateRefs& state, std::span<const std::byte> image) {
  common::ByteReader in(image);
  const auto version = in.get<std::uint32_t>();
  if (version != kImageVersion) {
    throw std::runtime_error("unsupported state image version " + std::to_string(version));
  }
  const auto block = in.get<common::BlockNumber>();
  state.bank.load(in);
  state.token.load(in);
  const bool has_lock = in.get<std::uint8_t>() != 0;
  if (has_lock != (state.liquidity_lock != nullptr)) {
    throw std::runtime_error("state image lock configuration does not match");
  }
  if (state.liquidity_lock) {
    state.liquidity_lock->load(in);
  }
  if (!in.exhausted()) {
    throw std::runtime_error("trailing bytes in state image");
  }
  state.clock.set(block);
}

}  // namespace replay
}  // namespace solidcore
