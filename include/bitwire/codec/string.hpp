#pragma once

#include "bitwire/core/bit_buffer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bitwire::codec {

/**
 * @brief 长度前缀（变长无符号整数）。
 *
 * 解码时：
 * - 超过 buf.max_sequence_length() 或 size_t 范围 -> errc::length_overflow
 */
void write_length(BitBuffer& buf, std::size_t length);
std::error_code read_length(BitBuffer& buf, std::size_t& out) noexcept;

/**
 * @brief 字节序列：长度前缀 + 原始字节（写游标字节对齐时整体 memcpy）。
 *
 * 解码时长度前缀大于剩余字节数直接返回 errc::unexpected_end，不做分配。
 */
void write_byte_string(BitBuffer& buf, bytes_view bytes);
std::error_code read_byte_string(BitBuffer& buf, std::vector<byte>& out);

/**
 * @brief 文本：编码与字节序列完全一致；解码额外做 UTF-8 校验。
 *
 * - 编码不做校验（调用方保证内容为 UTF-8）；
 * - 解码失败返回 errc::invalid_utf8，首个非法序列在字符串内的偏移记录到
 *   buf.invalid_utf8_offset()，invalid_at 非空时也写入该偏移；
 * - 失败时 out 保持不变。
 */
void write_string(BitBuffer& buf, std::string_view text);
std::error_code read_string(BitBuffer& buf, std::string& out, std::size_t* invalid_at = nullptr);

}  // namespace bitwire::codec
