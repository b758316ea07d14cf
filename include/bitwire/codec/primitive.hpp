#pragma once

#include "bitwire/core/bit_buffer.hpp"

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <system_error>
#include <type_traits>

namespace bitwire::codec {

/**
 * @brief 表示 count 个取值所需的最少位数：count <= 1 时为 0。
 *
 * 用于 tagged union 判别值、带计数的枚举、区间整数。
 */
[[nodiscard]] constexpr unsigned bits_for_count(std::uint64_t count) noexcept {
  return count <= 1 ? 0u : static_cast<unsigned>(std::bit_width(count - 1));
}

/**
 * @brief 区间跨度 span（= max - min）所需位数。
 */
[[nodiscard]] constexpr unsigned bits_for_span(std::uint64_t span) noexcept {
  return static_cast<unsigned>(std::bit_width(span));
}

template <std::integral T>
[[nodiscard]] constexpr unsigned bit_width_of() noexcept {
  return static_cast<unsigned>(std::numeric_limits<std::make_unsigned_t<T>>::digits);
}

// ---- 定宽整数：无符号直接按位宽写入；有符号按补码位模式写入 ----

template <std::integral T>
void write_fixed(BitBuffer& buf, T value) {
  using U = std::make_unsigned_t<T>;
  buf.write_bits(static_cast<std::uint64_t>(static_cast<U>(value)), bit_width_of<T>());
}

template <std::integral T>
std::error_code read_fixed(BitBuffer& buf, T& out) noexcept {
  using U = std::make_unsigned_t<T>;
  std::uint64_t v = 0;
  auto ec = buf.read_bits(bit_width_of<T>(), v);
  if (ec) {
    return ec;
  }
  out = static_cast<T>(static_cast<U>(v));
  return {};
}

inline void write_bool(BitBuffer& buf, bool value) { buf.write_bit(value); }

inline std::error_code read_bool(BitBuffer& buf, bool& out) noexcept { return buf.read_bit(out); }

// ---- 浮点：IEEE-754 位模式，不做额外压缩 ----

void write_f32(BitBuffer& buf, float value);
std::error_code read_f32(BitBuffer& buf, float& out) noexcept;

void write_f64(BitBuffer& buf, double value);
std::error_code read_f64(BitBuffer& buf, double& out) noexcept;

}  // namespace bitwire::codec
