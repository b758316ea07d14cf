#include "bitwire/codec/varint.hpp"

#include <bit>

namespace bitwire::codec {
namespace {

constexpr std::uint64_t kDataMask = 0x7Fu;
constexpr std::uint64_t kContinuationBit = 0x80u;

}  // namespace

void write_varint(BitBuffer& buf, std::uint64_t value) {
  // 至少写一组：0 编码为单组 0x00。
  do {
    const auto data = value & kDataMask;
    value >>= kVarintDataBits;
    const auto group = value != 0 ? (data | kContinuationBit) : data;
    buf.write_bits(group, kVarintGroupBits);
  } while (value != 0);
}

std::error_code read_varint(BitBuffer& buf, std::uint64_t& out, unsigned value_bits) noexcept {
  if (value_bits == 0 || value_bits > 64) {
    return make_error_code(errc::invalid_argument);
  }

  const auto max_groups = max_varint_groups(value_bits);
  std::uint64_t result = 0;
  for (unsigned i = 0; i < max_groups; ++i) {
    std::uint64_t group = 0;
    auto ec = buf.read_bits(kVarintGroupBits, group);
    if (ec) {
      return ec;
    }

    const auto data = group & kDataMask;
    const auto shift = i * kVarintDataBits;
    // 最后一组只有 value_bits - shift 位有效，多出的数据位意味着数值溢出目标宽度。
    const auto room = value_bits - shift;
    if (room < kVarintDataBits && (data >> room) != 0) {
      return make_error_code(errc::malformed_varint);
    }
    result |= data << shift;

    if ((group & kContinuationBit) == 0) {
      out = result;
      return {};
    }
  }
  return make_error_code(errc::malformed_varint);
}

std::size_t varint_size_bits(std::uint64_t value) noexcept {
  const auto significant = static_cast<std::size_t>(std::bit_width(value));
  const auto groups = significant == 0 ? 1 : (significant + kVarintDataBits - 1) / kVarintDataBits;
  return groups * kVarintGroupBits;
}

}  // namespace bitwire::codec
