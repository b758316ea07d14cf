#include "bitwire/core/log.hpp"

#include "bitwire/core/common.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace bitwire::core {
namespace {

// 下标即 LogLevel 的取值。
constexpr std::array<spdlog::level::level_enum, 7> kLevelTable{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

} // namespace

void set_log_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    spdlog::set_level(index < kLevelTable.size() ? kLevelTable[index] : spdlog::level::off);
}

LogLevel log_level() noexcept {
    const auto current = spdlog::get_level();
    for (std::size_t i = 0; i < kLevelTable.size(); ++i) {
        if (kLevelTable[i] == current) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

namespace detail {

void log_decode_failure(const std::error_code &ec,
                        std::size_t read_position,
                        std::size_t total_bits) {
    // 格式化有开销，级别未开启时直接返回。
    if (!spdlog::should_log(spdlog::level::debug)) {
        return;
    }
    spdlog::debug("bitwire: format v{} decode failed at bit {}/{}: {} ({})",
                  kFormatVersion,
                  read_position,
                  total_bits,
                  ec.message(),
                  ec.value());
}

void log_invalid_utf8(std::size_t offset,
                      std::size_t string_start_bit) {
    spdlog::debug("bitwire: invalid utf-8 at byte {} of string starting at bit {}",
                  offset,
                  string_start_bit);
}

void log_buffer_growth(std::size_t old_capacity,
                       std::size_t new_capacity) {
    spdlog::trace("bitwire: bit buffer capacity {} -> {} bytes", old_capacity, new_capacity);
}

} // namespace detail

} // namespace bitwire::core
