#pragma once

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace bitwire::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别；
 * - 日志只用于排查，不影响任何编解码结果。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

namespace detail {

// 模板代码（serialize.hpp 等）通过这些非模板入口写日志，避免 public header 依赖 spdlog。
void log_decode_failure(const std::error_code &ec,
                        std::size_t read_position,
                        std::size_t total_bits);

// offset 为字符串内的字节偏移，string_start_bit 为该字符串长度前缀之后第一个字节的位置。
void log_invalid_utf8(std::size_t offset,
                      std::size_t string_start_bit);

void log_buffer_growth(std::size_t old_capacity,
                       std::size_t new_capacity);

} // namespace detail

} // namespace bitwire::core
