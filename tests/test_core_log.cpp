#include "bitwire/core/log.hpp"
#include "bitwire/serialize.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <vector>

namespace {

using bitwire::core::LogLevel;
using bitwire::core::log_level;
using bitwire::core::set_log_level;

void test_log_level_roundtrip() {
    const LogLevel levels[] = {LogLevel::critical, LogLevel::trace, LogLevel::warn,
                               LogLevel::debug,    LogLevel::error, LogLevel::info,
                               LogLevel::off};
    for (auto level : levels) {
        set_log_level(level);
        TEST_EXPECT_EQ(log_level(), level);
    }

    // 越界的枚举值按关闭处理。
    set_log_level(static_cast<LogLevel>(42));
    TEST_EXPECT_EQ(log_level(), LogLevel::off);
}

// 打开最详细的日志后，扩容与解码失败都会输出日志，但结果不受影响。
void test_logging_does_not_change_results() {
    set_log_level(LogLevel::trace);

    bitwire::BitBuffer buf(1);
    for (std::uint32_t i = 0; i < 64; ++i) {
        buf.write_bits(i, 7);
    }
    TEST_EXPECT_EQ(buf.bit_size(), 64u * 7u);

    const std::vector<std::uint8_t> truncated{0x80};
    std::int32_t out = 42;
    auto ec = bitwire::decode(truncated, out);
    TEST_EXPECT_ERROR(ec, bitwire::errc::unexpected_end);
    TEST_EXPECT_EQ(out, 42);

    set_log_level(LogLevel::off);
}

} // namespace

int main() {
    test_log_level_roundtrip();
    test_logging_does_not_change_results();
    return ::bitwire::tests::run_and_report();
}
