#pragma once

#include "bitwire/core/bit_buffer.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <system_error>
#include <type_traits>

namespace bitwire::codec {

/**
 * @brief 变长无符号整数（线格式版本 1）。
 *
 * 每组 8 位，作为一次 write_bits(group, 8) 写入：
 * - bit0..bit6：7 位数据，低位组在前；
 * - bit7：继续位，置 1 表示后面还有组。
 *
 * 因此 0 编码为单字节 0x00，127 为 0x7F，128 为 0x80 0x01。
 * 目标宽度为 B 位时最多 ceil(B / 7) 组（64 位为 10 组），超出或数值溢出目标
 * 宽度均返回 errc::malformed_varint。
 */
inline constexpr unsigned kVarintGroupBits = 8;
inline constexpr unsigned kVarintDataBits = 7;

[[nodiscard]] constexpr unsigned max_varint_groups(unsigned value_bits) noexcept {
  return (value_bits + kVarintDataBits - 1) / kVarintDataBits;
}

/**
 * @brief zigzag：0,-1,1,-2,2,... -> 0,1,2,3,4,...
 *
 * 全程在无符号域上做移位/异或，最小负数不会溢出。
 */
template <std::signed_integral S>
[[nodiscard]] constexpr std::make_unsigned_t<S> zigzag_encode(S n) noexcept {
  using U = std::make_unsigned_t<S>;
  constexpr unsigned bits = std::numeric_limits<U>::digits;
  const auto shifted = static_cast<U>(static_cast<U>(n) << 1);
  const auto sign = static_cast<U>(n >> (bits - 1));  // 0 或全 1
  return static_cast<U>(shifted ^ sign);
}

template <std::unsigned_integral U>
[[nodiscard]] constexpr std::make_signed_t<U> zigzag_decode(U u) noexcept {
  const auto sign = static_cast<U>(0u - static_cast<U>(u & 1u));
  return static_cast<std::make_signed_t<U>>(static_cast<U>((u >> 1) ^ sign));
}

void write_varint(BitBuffer& buf, std::uint64_t value);

/**
 * @brief 读取一个变长无符号整数，要求结果能放进 value_bits 位（1..64）。
 */
std::error_code read_varint(BitBuffer& buf, std::uint64_t& out, unsigned value_bits = 64) noexcept;

/**
 * @brief value 编码后的位数（8 的倍数，至少 8）。
 */
[[nodiscard]] std::size_t varint_size_bits(std::uint64_t value) noexcept;

template <std::unsigned_integral U>
void write_varint_as(BitBuffer& buf, U value) {
  write_varint(buf, static_cast<std::uint64_t>(value));
}

template <std::unsigned_integral U>
std::error_code read_varint_as(BitBuffer& buf, U& out) noexcept {
  std::uint64_t v = 0;
  auto ec = read_varint(buf, v, static_cast<unsigned>(std::numeric_limits<U>::digits));
  if (ec) {
    return ec;
  }
  out = static_cast<U>(v);
  return {};
}

template <std::signed_integral S>
void write_zigzag(BitBuffer& buf, S value) {
  write_varint(buf, static_cast<std::uint64_t>(zigzag_encode(value)));
}

template <std::signed_integral S>
std::error_code read_zigzag(BitBuffer& buf, S& out) noexcept {
  std::make_unsigned_t<S> u = 0;
  auto ec = read_varint_as(buf, u);
  if (ec) {
    return ec;
  }
  out = zigzag_decode(u);
  return {};
}

}  // namespace bitwire::codec
