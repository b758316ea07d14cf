#include "bitwire/codec/primitive.hpp"

namespace bitwire::codec {

static_assert(std::numeric_limits<float>::is_iec559, "float must be IEEE-754 binary32");
static_assert(std::numeric_limits<double>::is_iec559, "double must be IEEE-754 binary64");

void write_f32(BitBuffer& buf, float value) {
  buf.write_bits(std::bit_cast<std::uint32_t>(value), 32);
}

std::error_code read_f32(BitBuffer& buf, float& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = buf.read_bits(32, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<float>(static_cast<std::uint32_t>(bits));
  return {};
}

void write_f64(BitBuffer& buf, double value) {
  buf.write_bits(std::bit_cast<std::uint64_t>(value), 64);
}

std::error_code read_f64(BitBuffer& buf, double& out) noexcept {
  std::uint64_t bits = 0;
  auto ec = buf.read_bits(64, bits);
  if (ec) {
    return ec;
  }
  out = std::bit_cast<double>(bits);
  return {};
}

}  // namespace bitwire::codec
