#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace bitwire::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// BitBuffer 默认初始容量（字节）：小消息（快照/输入帧）一般在几百字节以内。
inline constexpr std::size_t kDefaultBitBufferCapacity = 256;

// 解码时单个序列（vector/string/map）允许的最大元素数：
// 防止损坏的长度前缀导致巨量分配。
inline constexpr std::size_t kDefaultMaxSequenceLength = 64 * 1024 * 1024;

// 动态 schema 解码的递归深度上限：防止恶意描述/输入导致栈溢出。
inline constexpr std::size_t kMaxDecodeDepth = 64;

// 线格式版本：varint 分组宽度、zigzag 公式、位序一旦改变必须递增。
inline constexpr std::uint32_t kFormatVersion = 1;

}  // namespace bitwire::core

namespace bitwire {

using core::byte;
using core::bytes_view;
using core::mutable_bytes_view;

}  // namespace bitwire
