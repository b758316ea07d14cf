#pragma once

#include "bitwire/core/common.hpp"

#include <cstddef>

namespace bitwire::core {

/**
 * @brief 编码配置。
 */
struct EncodeOptions final {
    // BitBuffer 初始容量（字节）；已知消息较大时调大可避免扩容。
    std::size_t initial_capacity{kDefaultBitBufferCapacity};
};

/**
 * @brief 解码配置（用于限制不可信输入的资源消耗）。
 */
struct DecodeOptions final {
    // 是否允许值解码完成后仍剩余整字节数据（默认拒绝，返回 errc::trailing_data）。
    // 最后一个字节中的补齐位永远不会被解释。
    bool allow_trailing_bytes{false};

    // 单个序列（vector/string/bytes/map）长度前缀上限，超出返回 errc::length_overflow。
    std::size_t max_sequence_length{kDefaultMaxSequenceLength};

    // 动态 schema 解码的最大嵌套深度，超出返回 errc::depth_exceeded。
    std::size_t max_depth{kMaxDecodeDepth};
};

} // namespace bitwire::core

namespace bitwire {

using core::DecodeOptions;
using core::EncodeOptions;

} // namespace bitwire
