#pragma once

#include "bitwire/core/bit_buffer.hpp"
#include "bitwire/core/error.hpp"
#include "bitwire/core/options.hpp"
#include "bitwire/schema/codec.hpp"
#include "bitwire/schema/fields.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace bitwire {

namespace detail {

/**
 * @brief 顶层解码的收尾：检查尾随整字节，并在失败时记录 debug 日志。
 *
 * 最后一个字节中不足 8 位的剩余部分是编码端的补齐位，永远不算尾随数据。
 */
std::error_code finish_decode(const BitBuffer& buf, std::error_code ec, const DecodeOptions& options);

template <schema::Decodable T>
std::error_code decode_from(BitBuffer& buf, T& out, const DecodeOptions& options) {
  buf.set_max_sequence_length(options.max_sequence_length);
  T value{};
  auto ec = finish_decode(buf, Codec<T>::decode(buf, value), options);
  if (ec) {
    return ec;
  }
  out = std::move(value);
  return {};
}

}  // namespace detail

/**
 * @brief 把一个值编码为字节序列（末尾不足 8 位以 0 补齐）。
 *
 * 对类型正确的值不会失败；内存不足时抛出 std::bad_alloc。
 */
template <schema::Encodable T>
[[nodiscard]] std::vector<byte> encode(const T& value, EncodeOptions options = {}) {
  BitBuffer buf(options.initial_capacity);
  Codec<T>::encode(buf, value);
  return buf.finish();
}

/**
 * @brief 从一条完整消息解码出 T。
 *
 * - 成功时 out 被赋值；失败时 out 保持不变；
 * - 值之后仍有整字节未读时返回 errc::trailing_data（options.allow_trailing_bytes 可放宽）。
 */
template <schema::Decodable T>
std::error_code decode(bytes_view bytes, T& out, DecodeOptions options = {}) {
  auto buf = BitBuffer::from_bytes(bytes);
  return detail::decode_from(buf, out, options);
}

/**
 * @brief 可复用的编解码器：在多次调用之间保留内部存储，减少分配。
 *
 * 注意：
 * - encode() 返回的视图在下一次 encode/decode 调用之前有效；
 * - 本类不做线程安全保证（每个线程各用一个实例）。
 */
class Buffer final {
 public:
  explicit Buffer(std::size_t initial_capacity = core::kDefaultBitBufferCapacity) : buf_(initial_capacity) {}

  template <schema::Encodable T>
  [[nodiscard]] bytes_view encode(const T& value) {
    buf_.clear();
    Codec<T>::encode(buf_, value);
    return buf_.bytes();
  }

  template <schema::Decodable T>
  std::error_code decode(bytes_view bytes, T& out, DecodeOptions options = {}) {
    buf_.assign(bytes);
    return detail::decode_from(buf_, out, options);
  }

  [[nodiscard]] BitBuffer& bit_buffer() noexcept { return buf_; }
  [[nodiscard]] const BitBuffer& bit_buffer() const noexcept { return buf_; }

 private:
  BitBuffer buf_;
};

}  // namespace bitwire
