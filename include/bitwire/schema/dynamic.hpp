#pragma once

#include "bitwire/core/bit_buffer.hpp"
#include "bitwire/core/options.hpp"
#include "bitwire/schema/descriptor.hpp"
#include "bitwire/schema/value.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bitwire::schema {

/**
 * @brief 按运行期描述编码一个动态值。
 *
 * 产出的位流与等价 C++ 类型的 Codec<T> 完全一致。
 *
 * 失败（返回 errc::schema_mismatch）的情形：
 * - 值的种类与描述不符（例如 u32 描述配 Signed 值）；
 * - 整数超出描述的位宽；
 * - structure 的元素个数与字段数不同；
 * - variant 下标越界。
 * 描述中出现空的子节点返回 errc::invalid_argument。
 *
 * 注意：失败时 buf 中可能已写入部分内容；需要“全有或全无”语义请使用 encode_value。
 */
std::error_code encode(const Descriptor& descriptor, const Value& value, BitBuffer& buf);

/**
 * @brief 按运行期描述从 buf 的读游标处解码一个动态值。
 *
 * - 错误分类与静态路径一致（unexpected_end / malformed_varint / invalid_utf8 /
 *   invalid_variant / length_overflow）；
 * - 嵌套（sequence/optional/structure/variant）超过 max_depth 层返回 errc::depth_exceeded；
 * - 序列长度上限取 buf.max_sequence_length()；
 * - 失败时 out 不被修改。
 */
std::error_code decode(const Descriptor& descriptor,
                       BitBuffer& buf,
                       Value& out,
                       std::size_t max_depth = core::kMaxDecodeDepth);

/**
 * @brief 整体编码为字节；成功时 out 被替换为编码结果，失败时 out 不变。
 */
std::error_code encode_value(const Descriptor& descriptor,
                             const Value& value,
                             std::vector<byte>& out,
                             EncodeOptions options = {});

/**
 * @brief 从完整的消息字节解码；尾随整字节的处理与 bitwire::decode 相同。
 */
std::error_code decode_value(const Descriptor& descriptor,
                             bytes_view bytes,
                             Value& out,
                             DecodeOptions options = {});

}  // namespace bitwire::schema
