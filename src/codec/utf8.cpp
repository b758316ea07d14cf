#include "bitwire/codec/utf8.hpp"

#include <cstdint>
#include <cstring>

namespace bitwire::codec {
namespace {

constexpr std::uint64_t kHighBits = 0x8080808080808080ull;

struct SequenceRule final {
  std::size_t length{0};
  byte second_lo{0x80};
  byte second_hi{0xBF};
};

// 根据首字节确定序列长度以及第二字节的合法区间（排除过长编码/代理区/超范围）。
[[nodiscard]] bool rule_for_lead(byte lead, SequenceRule& rule) noexcept {
  if (lead >= 0xC2 && lead <= 0xDF) {
    rule = {2, 0x80, 0xBF};
    return true;
  }
  if (lead == 0xE0) {
    rule = {3, 0xA0, 0xBF};
    return true;
  }
  if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
    rule = {3, 0x80, 0xBF};
    return true;
  }
  if (lead == 0xED) {
    rule = {3, 0x80, 0x9F};
    return true;
  }
  if (lead == 0xF0) {
    rule = {4, 0x90, 0xBF};
    return true;
  }
  if (lead >= 0xF1 && lead <= 0xF3) {
    rule = {4, 0x80, 0xBF};
    return true;
  }
  if (lead == 0xF4) {
    rule = {4, 0x80, 0x8F};
    return true;
  }
  return false;
}

[[nodiscard]] bool is_continuation(byte b) noexcept { return (b & 0xC0u) == 0x80u; }

}  // namespace

std::error_code validate_utf8(bytes_view bytes, std::size_t& invalid_at) noexcept {
  const byte* p = bytes.data();
  const std::size_t n = bytes.size();
  std::size_t i = 0;

  while (i < n) {
    // ASCII 快速路径：8 字节一组，任一字节最高位为 1 时退出。
    while (n - i >= 8) {
      std::uint64_t word = 0;
      std::memcpy(&word, p + i, sizeof(word));
      if ((word & kHighBits) != 0) {
        break;
      }
      i += 8;
    }
    if (i >= n) {
      break;
    }

    const byte lead = p[i];
    if (lead < 0x80) {
      ++i;
      continue;
    }

    SequenceRule rule{};
    if (!rule_for_lead(lead, rule) || n - i < rule.length) {
      invalid_at = i;
      return make_error_code(errc::invalid_utf8);
    }
    const byte second = p[i + 1];
    if (second < rule.second_lo || second > rule.second_hi) {
      invalid_at = i;
      return make_error_code(errc::invalid_utf8);
    }
    for (std::size_t k = 2; k < rule.length; ++k) {
      if (!is_continuation(p[i + k])) {
        invalid_at = i;
        return make_error_code(errc::invalid_utf8);
      }
    }
    i += rule.length;
  }
  return {};
}

bool is_valid_utf8(bytes_view bytes) noexcept {
  std::size_t ignored = 0;
  return !validate_utf8(bytes, ignored);
}

}  // namespace bitwire::codec
