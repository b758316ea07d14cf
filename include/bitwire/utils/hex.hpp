#pragma once

#include "bitwire/core/common.hpp"
#include "bitwire/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bitwire::utils {

/**
 * @brief 16 进制 / 二进制位串的格式化与解析工具。
 *
 * 典型使用场景：
 * - 把测试或抓包里的 "03 05 00 FF" 解析为 bytes，直接喂给 decode；
 * - 把 encode 的结果以 hexdump 或位串形式打印，逐位核对字段边界。
 */

struct HexDumpOptions final {
    // 每行字节数（典型 16/32）。
    std::size_t bytes_per_line{16};

    // 输出的最大字节数（0 表示不限制）。超出部分会打印截断提示。
    std::size_t max_bytes{256};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ASCII 侧栏（仅展示可打印字符，其余用 '.'）。
    bool show_ascii{false};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持：
 * - 大小写 hex；
 * - 分隔符：空白、逗号、冒号、连字符、下划线、方括号等；
 * - 可选的 0x/0X 前缀（会被忽略）。
 *
 * 奇数个 nibble 或出现非 hex 字符时返回 errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text, std::vector<byte> &out) noexcept;

/**
 * @brief 按写入顺序把前 bit_count 位渲染为 8 位一组的位串（组间以空格分隔）。
 *
 * 每组内按高位在前打印，因此对齐的整字节读起来就是它的二进制字面量：
 * bit_string({0x03, 0x05}, 16) == "00000011 00000101"。
 * 最后一组不足 8 位时只打印实际存在的位（仍然高位在前）。
 * bit_count 超过 8 * bytes.size() 时按后者截断。
 */
[[nodiscard]] std::string bit_string(bytes_view bytes, std::size_t bit_count);

[[nodiscard]] inline std::string bit_string(bytes_view bytes) {
    return bit_string(bytes, bytes.size() * 8);
}

} // namespace bitwire::utils
