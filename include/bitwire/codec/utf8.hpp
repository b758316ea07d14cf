#pragma once

#include "bitwire/core/common.hpp"
#include "bitwire/core/error.hpp"

#include <cstddef>
#include <system_error>

namespace bitwire::codec {

/**
 * @brief 校验 bytes 是否为合法 UTF-8（RFC 3629）。
 *
 * 非法情形：过长编码、代理区（U+D800..U+DFFF）、大于 U+10FFFF 的码点、
 * 0xC0/0xC1/0xF5..0xFF 首字节、被截断的多字节序列。
 *
 * 实现：每次 8 字节的 ASCII 快速扫描，遇到非 ASCII 再逐序列检查，发现第一个
 * 非法序列立即返回。
 *
 * 失败返回 errc::invalid_utf8，invalid_at 为该非法序列首字节的偏移；成功时
 * invalid_at 不变。
 */
std::error_code validate_utf8(bytes_view bytes, std::size_t& invalid_at) noexcept;

[[nodiscard]] bool is_valid_utf8(bytes_view bytes) noexcept;

}  // namespace bitwire::codec
