#pragma once

#include <system_error>

namespace bitwire::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 解码路径一律返回 std::error_code，不抛异常；
 * - 编码路径对类型正确的值不会失败（内存耗尽除外，表现为 std::bad_alloc）；
 * - 动态 schema 编码在值与描述不一致时返回 schema_mismatch。
 */
enum class errc : int {
  ok = 0,
  unexpected_end = 1,
  malformed_varint = 2,
  invalid_utf8 = 3,
  invalid_variant = 4,
  out_of_range = 5,
  length_overflow = 6,
  trailing_data = 7,
  invalid_argument = 8,
  schema_mismatch = 9,
  depth_exceeded = 10,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bitwire::core

namespace bitwire {

using core::errc;
using core::make_error_code;

}  // namespace bitwire

namespace std {
template <>
struct is_error_code_enum<bitwire::core::errc> : true_type {};
}  // namespace std
