#pragma once

#include "bitwire/codec/primitive.hpp"
#include "bitwire/codec/string.hpp"
#include "bitwire/codec/varint.hpp"
#include "bitwire/core/bit_buffer.hpp"
#include "bitwire/core/error.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace bitwire::schema {

/**
 * @brief 类型 T 的编解码绑定（编译期 schema）。
 *
 * 每个特化提供：
 * - static void encode(BitBuffer&, const T&)：对类型正确的值不会失败；
 * - static std::error_code decode(BitBuffer&, T&)：失败时 T 不被修改；
 * - static constexpr std::size_t min_bits：任意合法编码至少占用的位数，
 *   用于在分配之前拒绝明显超出剩余输入的长度前缀。
 *
 * 线格式不携带字段名/类型标记：编码端与解码端必须使用完全一致的类型。
 */
template <class T>
struct Codec;

/**
 * @brief Concept 约束：用户复合类型（struct/class）按字段顺序自行编解码。
 *
 * 一般通过 BITWIRE_FIELDS(...) 宏生成这两个成员函数（见 fields.hpp）。
 */
template <class T>
concept Schema = requires(const T& value, T& target, BitBuffer& buf) {
  { value.encode(buf) } -> std::same_as<void>;
  { target.decode(buf) } -> std::same_as<std::error_code>;
};

template <class T>
concept Encodable = requires(BitBuffer& buf, const T& value) { Codec<T>::encode(buf, value); };

template <class T>
concept Decodable = std::default_initializable<T> && requires(BitBuffer& buf, T& out) {
  { Codec<T>::decode(buf, out) } -> std::same_as<std::error_code>;
};

/**
 * @brief 带变体个数的枚举：特化 enum_traits<E>::count 后按最少位数编码。
 *
 * 枚举值必须是 0..count-1；解码得到 >= count 的值返回 errc::invalid_variant。
 * 未特化的枚举按底层整数类型编码。
 */
template <class E>
struct enum_traits {};

template <class E>
concept CountedEnum = std::is_enum_v<E> && requires {
  { enum_traits<E>::count } -> std::convertible_to<std::size_t>;
};

// ---- 编码方式包装类型 ----

/**
 * @brief 有符号整数按完整补码位宽定长编码（默认是 zigzag + 变长）。
 */
template <std::signed_integral S>
struct Fixed final {
  S value{};
  friend bool operator==(const Fixed&, const Fixed&) = default;
};

/**
 * @brief 无符号整数按变长编码（默认是定长）。
 */
template <std::unsigned_integral U>
struct Varint final {
  U value{};
  friend bool operator==(const Varint&, const Varint&) = default;
};

/**
 * @brief 已知落在 [Min, Max] 的整数：编码 value - Min，占 bit_width(Max - Min) 位。
 *
 * 编码时超出区间的值被截断到边界；解码得到超出跨度的偏移返回 errc::out_of_range。
 */
template <std::integral T, T Min, T Max>
  requires(Min <= Max && !std::same_as<T, bool>)
struct Ranged final {
  T value{Min};
  friend bool operator==(const Ranged&, const Ranged&) = default;
};

namespace detail {

// 可能零位编码的元素（min_bits == 0）不受剩余输入约束：长度前缀最多只能比剩余位数
// 多出这么多个元素，预留量也以此为上限。
inline constexpr std::size_t kMaxZeroBitElements = 4096;

// 超出剩余输入的长度前缀在分配前就返回 unexpected_end；
// 零位元素的长度超过 remaining_bits() + kMaxZeroBitElements 时返回 length_overflow，
// 损坏的前缀因此无法触发与输入大小无关的循环次数。
template <class T>
std::error_code read_sequence_length(BitBuffer& buf, std::size_t& length) noexcept {
  auto ec = codec::read_length(buf, length);
  if (ec) {
    return ec;
  }
  constexpr std::size_t per_element = Codec<T>::min_bits;
  if constexpr (per_element > 0) {
    if (length > buf.remaining_bits() / per_element) {
      return make_error_code(errc::unexpected_end);
    }
  } else {
    if (length > buf.remaining_bits() + kMaxZeroBitElements) {
      return make_error_code(errc::length_overflow);
    }
  }
  return {};
}

template <class T>
[[nodiscard]] constexpr std::size_t reserve_hint(std::size_t length) noexcept {
  if constexpr (Codec<T>::min_bits > 0) {
    return length;
  } else {
    return std::min(length, kMaxZeroBitElements);
  }
}

}  // namespace detail

// ---- 基础类型 ----

template <>
struct Codec<bool> {
  static constexpr std::size_t min_bits = 1;
  static void encode(BitBuffer& buf, const bool& value) { codec::write_bool(buf, value); }
  static std::error_code decode(BitBuffer& buf, bool& out) noexcept { return codec::read_bool(buf, out); }
};

template <>
struct Codec<char> {
  static constexpr std::size_t min_bits = 8;
  static void encode(BitBuffer& buf, const char& value) { codec::write_fixed(buf, value); }
  static std::error_code decode(BitBuffer& buf, char& out) noexcept { return codec::read_fixed(buf, out); }
};

// 无符号整数：定长。
template <class U>
  requires(std::unsigned_integral<U> && !std::same_as<U, bool> && !std::same_as<U, char>)
struct Codec<U> {
  static constexpr std::size_t min_bits = codec::bit_width_of<U>();
  static void encode(BitBuffer& buf, const U& value) { codec::write_fixed(buf, value); }
  static std::error_code decode(BitBuffer& buf, U& out) noexcept { return codec::read_fixed(buf, out); }
};

// 有符号整数：zigzag + 变长。
template <class S>
  requires(std::signed_integral<S> && !std::same_as<S, char>)
struct Codec<S> {
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;
  static void encode(BitBuffer& buf, const S& value) { codec::write_zigzag(buf, value); }
  static std::error_code decode(BitBuffer& buf, S& out) noexcept { return codec::read_zigzag(buf, out); }
};

template <>
struct Codec<float> {
  static constexpr std::size_t min_bits = 32;
  static void encode(BitBuffer& buf, const float& value) { codec::write_f32(buf, value); }
  static std::error_code decode(BitBuffer& buf, float& out) noexcept { return codec::read_f32(buf, out); }
};

template <>
struct Codec<double> {
  static constexpr std::size_t min_bits = 64;
  static void encode(BitBuffer& buf, const double& value) { codec::write_f64(buf, value); }
  static std::error_code decode(BitBuffer& buf, double& out) noexcept { return codec::read_f64(buf, out); }
};

template <CountedEnum E>
struct Codec<E> {
  static constexpr std::size_t count = enum_traits<E>::count;
  static constexpr unsigned bits = codec::bits_for_count(count);
  static constexpr std::size_t min_bits = bits;

  static void encode(BitBuffer& buf, const E& value) {
    using U = std::make_unsigned_t<std::underlying_type_t<E>>;
    buf.write_bits(static_cast<std::uint64_t>(static_cast<U>(value)), bits);
  }

  static std::error_code decode(BitBuffer& buf, E& out) noexcept {
    std::uint64_t index = 0;
    auto ec = buf.read_bits(bits, index);
    if (ec) {
      return ec;
    }
    if (index >= count) {
      return make_error_code(errc::invalid_variant);
    }
    out = static_cast<E>(index);
    return {};
  }
};

template <class E>
  requires(std::is_enum_v<E> && !CountedEnum<E>)
struct Codec<E> {
  using underlying = std::underlying_type_t<E>;
  static constexpr std::size_t min_bits = Codec<underlying>::min_bits;

  static void encode(BitBuffer& buf, const E& value) {
    Codec<underlying>::encode(buf, static_cast<underlying>(value));
  }

  static std::error_code decode(BitBuffer& buf, E& out) noexcept {
    underlying v{};
    auto ec = Codec<underlying>::decode(buf, v);
    if (ec) {
      return ec;
    }
    out = static_cast<E>(v);
    return {};
  }
};

template <std::signed_integral S>
struct Codec<Fixed<S>> {
  static constexpr std::size_t min_bits = codec::bit_width_of<S>();
  static void encode(BitBuffer& buf, const Fixed<S>& value) { codec::write_fixed(buf, value.value); }
  static std::error_code decode(BitBuffer& buf, Fixed<S>& out) noexcept {
    return codec::read_fixed(buf, out.value);
  }
};

template <std::unsigned_integral U>
struct Codec<Varint<U>> {
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;
  static void encode(BitBuffer& buf, const Varint<U>& value) { codec::write_varint_as(buf, value.value); }
  static std::error_code decode(BitBuffer& buf, Varint<U>& out) noexcept {
    return codec::read_varint_as(buf, out.value);
  }
};

template <std::integral T, T Min, T Max>
  requires(Min <= Max && !std::same_as<T, bool>)
struct Codec<Ranged<T, Min, Max>> {
  using U = std::make_unsigned_t<T>;
  static constexpr U span = static_cast<U>(static_cast<U>(Max) - static_cast<U>(Min));
  static constexpr unsigned bits = codec::bits_for_span(span);
  static constexpr std::size_t min_bits = bits;

  static void encode(BitBuffer& buf, const Ranged<T, Min, Max>& value) {
    const T clamped = std::clamp(value.value, Min, Max);
    const auto offset = static_cast<U>(static_cast<U>(clamped) - static_cast<U>(Min));
    buf.write_bits(static_cast<std::uint64_t>(offset), bits);
  }

  static std::error_code decode(BitBuffer& buf, Ranged<T, Min, Max>& out) noexcept {
    std::uint64_t offset = 0;
    auto ec = buf.read_bits(bits, offset);
    if (ec) {
      return ec;
    }
    if (offset > static_cast<std::uint64_t>(span)) {
      return make_error_code(errc::out_of_range);
    }
    out.value = static_cast<T>(static_cast<U>(static_cast<U>(Min) + static_cast<U>(offset)));
    return {};
  }
};

// ---- 文本与字节 ----

template <>
struct Codec<std::string> {
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;
  static void encode(BitBuffer& buf, const std::string& value) { codec::write_string(buf, value); }
  static std::error_code decode(BitBuffer& buf, std::string& out) { return codec::read_string(buf, out); }
};

// 字节序列与 std::vector<T> 的通用编码逐位一致，这里只是走整体拷贝的快路径。
template <>
struct Codec<std::vector<std::uint8_t>> {
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;
  static void encode(BitBuffer& buf, const std::vector<std::uint8_t>& value) {
    codec::write_byte_string(buf, bytes_view{value.data(), value.size()});
  }
  static std::error_code decode(BitBuffer& buf, std::vector<std::uint8_t>& out) {
    return codec::read_byte_string(buf, out);
  }
};

// ---- 容器与复合 ----

template <>
struct Codec<std::monostate> {
  static constexpr std::size_t min_bits = 0;
  static void encode(BitBuffer&, const std::monostate&) {}
  static std::error_code decode(BitBuffer&, std::monostate&) noexcept { return {}; }
};

template <class T>
struct Codec<std::vector<T>> {
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;

  static void encode(BitBuffer& buf, const std::vector<T>& value) {
    codec::write_length(buf, value.size());
    if constexpr (Codec<T>::min_bits > 0) {
      // 元素的最小总位数一次性预留，避免逐元素扩容。
      buf.reserve_bits(value.size() * Codec<T>::min_bits);
    }
    for (const auto& element : value) {
      Codec<T>::encode(buf, element);
    }
  }

  static std::error_code decode(BitBuffer& buf, std::vector<T>& out) {
    std::size_t length = 0;
    auto ec = detail::read_sequence_length<T>(buf, length);
    if (ec) {
      return ec;
    }
    std::vector<T> values;
    values.reserve(detail::reserve_hint<T>(length));
    for (std::size_t i = 0; i < length; ++i) {
      T element{};
      ec = Codec<T>::decode(buf, element);
      if (ec) {
        return ec;
      }
      values.push_back(std::move(element));
    }
    out = std::move(values);
    return {};
  }
};

// 定长数组：不写长度前缀。
template <class T, std::size_t N>
struct Codec<std::array<T, N>> {
  static constexpr std::size_t min_bits = N * Codec<T>::min_bits;

  static void encode(BitBuffer& buf, const std::array<T, N>& value) {
    for (const auto& element : value) {
      Codec<T>::encode(buf, element);
    }
  }

  static std::error_code decode(BitBuffer& buf, std::array<T, N>& out) {
    std::array<T, N> values{};
    for (auto& element : values) {
      auto ec = Codec<T>::decode(buf, element);
      if (ec) {
        return ec;
      }
    }
    out = std::move(values);
    return {};
  }
};

// 可选值：1 位存在标记，置位时紧跟内部值。
template <class T>
struct Codec<std::optional<T>> {
  static constexpr std::size_t min_bits = 1;

  static void encode(BitBuffer& buf, const std::optional<T>& value) {
    buf.write_bit(value.has_value());
    if (value) {
      Codec<T>::encode(buf, *value);
    }
  }

  static std::error_code decode(BitBuffer& buf, std::optional<T>& out) {
    bool present = false;
    auto ec = buf.read_bit(present);
    if (ec) {
      return ec;
    }
    if (!present) {
      out.reset();
      return {};
    }
    T inner{};
    ec = Codec<T>::decode(buf, inner);
    if (ec) {
      return ec;
    }
    out = std::move(inner);
    return {};
  }
};

/**
 * @brief Tagged union：定宽判别值（bits_for_count(变体个数) 位）+ 该变体的编码。
 *
 * 单一变体时判别值占 0 位；解码得到越界判别值返回 errc::invalid_variant。
 * 各变体类型需可默认构造。
 */
template <class... Ts>
struct Codec<std::variant<Ts...>> {
  using variant_type = std::variant<Ts...>;
  static constexpr std::size_t alternatives = sizeof...(Ts);
  static constexpr unsigned tag_bits = codec::bits_for_count(alternatives);
  static constexpr std::size_t min_bits = tag_bits;

  static void encode(BitBuffer& buf, const variant_type& value) {
    buf.write_bits(static_cast<std::uint64_t>(value.index()), tag_bits);
    std::visit(
      [&](const auto& alternative) {
        using A = std::decay_t<decltype(alternative)>;
        Codec<A>::encode(buf, alternative);
      },
      value);
  }

  static std::error_code decode(BitBuffer& buf, variant_type& out) {
    std::uint64_t tag = 0;
    auto ec = buf.read_bits(tag_bits, tag);
    if (ec) {
      return ec;
    }
    if (tag >= alternatives) {
      return make_error_code(errc::invalid_variant);
    }
    return dispatch(static_cast<std::size_t>(tag), buf, out, std::index_sequence_for<Ts...>{});
  }

 private:
  using decode_fn = std::error_code (*)(BitBuffer&, variant_type&);

  template <std::size_t I>
  static std::error_code decode_alternative(BitBuffer& buf, variant_type& out) {
    using A = std::variant_alternative_t<I, variant_type>;
    A value{};
    auto ec = Codec<A>::decode(buf, value);
    if (ec) {
      return ec;
    }
    out.template emplace<I>(std::move(value));
    return {};
  }

  template <std::size_t... Is>
  static std::error_code dispatch(std::size_t tag,
                                  BitBuffer& buf,
                                  variant_type& out,
                                  std::index_sequence<Is...>) {
    static constexpr decode_fn table[] = {&decode_alternative<Is>...};
    return table[tag](buf, out);
  }
};

template <class... Ts>
struct Codec<std::tuple<Ts...>> {
  static constexpr std::size_t min_bits = (std::size_t{0} + ... + Codec<Ts>::min_bits);

  static void encode(BitBuffer& buf, const std::tuple<Ts...>& value) {
    std::apply([&](const auto&... elements) { (Codec<Ts>::encode(buf, elements), ...); }, value);
  }

  static std::error_code decode(BitBuffer& buf, std::tuple<Ts...>& out) {
    std::tuple<Ts...> values{};
    std::error_code ec;
    // 逐个解码，遇到第一个错误即停止（&& 短路）。
    std::apply([&](auto&... elements) { ((ec = Codec<Ts>::decode(buf, elements), !ec) && ...); },
               values);
    if (ec) {
      return ec;
    }
    out = std::move(values);
    return {};
  }
};

template <class A, class B>
struct Codec<std::pair<A, B>> {
  static constexpr std::size_t min_bits = Codec<A>::min_bits + Codec<B>::min_bits;

  static void encode(BitBuffer& buf, const std::pair<A, B>& value) {
    Codec<A>::encode(buf, value.first);
    Codec<B>::encode(buf, value.second);
  }

  static std::error_code decode(BitBuffer& buf, std::pair<A, B>& out) {
    std::pair<A, B> values{};
    auto ec = Codec<A>::decode(buf, values.first);
    if (ec) {
      return ec;
    }
    ec = Codec<B>::decode(buf, values.second);
    if (ec) {
      return ec;
    }
    out = std::move(values);
    return {};
  }
};

// 映射：长度前缀 + 按键升序的 (key, value) 序列；解码遇到重复键时后者覆盖前者。
template <class K, class V, class Compare, class Alloc>
struct Codec<std::map<K, V, Compare, Alloc>> {
  using map_type = std::map<K, V, Compare, Alloc>;
  static constexpr std::size_t min_bits = codec::kVarintGroupBits;

  static void encode(BitBuffer& buf, const map_type& value) {
    codec::write_length(buf, value.size());
    for (const auto& [key, mapped] : value) {
      Codec<K>::encode(buf, key);
      Codec<V>::encode(buf, mapped);
    }
  }

  static std::error_code decode(BitBuffer& buf, map_type& out) {
    std::size_t length = 0;
    auto ec = detail::read_sequence_length<std::pair<K, V>>(buf, length);
    if (ec) {
      return ec;
    }
    map_type values;
    for (std::size_t i = 0; i < length; ++i) {
      K key{};
      ec = Codec<K>::decode(buf, key);
      if (ec) {
        return ec;
      }
      V mapped{};
      ec = Codec<V>::decode(buf, mapped);
      if (ec) {
        return ec;
      }
      values.insert_or_assign(std::move(key), std::move(mapped));
    }
    out = std::move(values);
    return {};
  }
};

// 用户复合类型：委托给成员 encode/decode；先解码到临时对象，成功后再整体赋值，
// 因此失败时调用方看不到“解了一半”的对象。
template <Schema T>
struct Codec<T> {
  static constexpr std::size_t min_bits = 0;

  static void encode(BitBuffer& buf, const T& value) { value.encode(buf); }

  static std::error_code decode(BitBuffer& buf, T& out) {
    T value{};
    auto ec = value.decode(buf);
    if (ec) {
      return ec;
    }
    out = std::move(value);
    return {};
  }
};

}  // namespace bitwire::schema

namespace bitwire {

using schema::Codec;
using schema::Fixed;
using schema::Ranged;
using schema::Varint;

}  // namespace bitwire
