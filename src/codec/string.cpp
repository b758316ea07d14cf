#include "bitwire/codec/string.hpp"

#include "bitwire/codec/utf8.hpp"
#include "bitwire/codec/varint.hpp"
#include "bitwire/core/log.hpp"

#include <cstdint>
#include <limits>
#include <utility>

namespace bitwire::codec {
namespace {

// 读取长度前缀并确认剩余数据至少有 length 个字节。
std::error_code read_byte_length(BitBuffer& buf, std::size_t& length) noexcept {
  auto ec = read_length(buf, length);
  if (ec) {
    return ec;
  }
  if (length > buf.remaining_bits() / 8) {
    return make_error_code(errc::unexpected_end);
  }
  return {};
}

}  // namespace

void write_length(BitBuffer& buf, std::size_t length) {
  write_varint(buf, static_cast<std::uint64_t>(length));
}

std::error_code read_length(BitBuffer& buf, std::size_t& out) noexcept {
  std::uint64_t v = 0;
  auto ec = read_varint(buf, v);
  if (ec) {
    return ec;
  }
  if (v > std::numeric_limits<std::size_t>::max() || v > buf.max_sequence_length()) {
    return make_error_code(errc::length_overflow);
  }
  out = static_cast<std::size_t>(v);
  return {};
}

void write_byte_string(BitBuffer& buf, bytes_view bytes) {
  write_length(buf, bytes.size());
  buf.write_bytes(bytes);
}

std::error_code read_byte_string(BitBuffer& buf, std::vector<byte>& out) {
  std::size_t length = 0;
  auto ec = read_byte_length(buf, length);
  if (ec) {
    return ec;
  }
  std::vector<byte> bytes(length);
  ec = buf.read_bytes(mutable_bytes_view{bytes.data(), bytes.size()});
  if (ec) {
    return ec;
  }
  out = std::move(bytes);
  return {};
}

void write_string(BitBuffer& buf, std::string_view text) {
  write_byte_string(buf, bytes_view{reinterpret_cast<const byte*>(text.data()), text.size()});
}

std::error_code read_string(BitBuffer& buf, std::string& out, std::size_t* invalid_at) {
  std::size_t length = 0;
  auto ec = read_byte_length(buf, length);
  if (ec) {
    return ec;
  }
  const std::size_t start_bit = buf.read_position();
  std::string text(length, '\0');
  ec = buf.read_bytes(mutable_bytes_view{reinterpret_cast<byte*>(text.data()), text.size()});
  if (ec) {
    return ec;
  }

  std::size_t offset = 0;
  ec = validate_utf8(bytes_view{reinterpret_cast<const byte*>(text.data()), text.size()}, offset);
  if (ec) {
    buf.note_invalid_utf8(offset);
    core::detail::log_invalid_utf8(offset, start_bit);
    if (invalid_at != nullptr) {
      *invalid_at = offset;
    }
    return ec;
  }
  out = std::move(text);
  return {};
}

}  // namespace bitwire::codec
