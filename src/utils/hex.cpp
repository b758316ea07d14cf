#include "bitwire/utils/hex.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

namespace bitwire::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *bytes = "\033[1;33m";
    static constexpr const char *ascii = "\033[1;32m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

// 返回 nibble 值；非 hex 字符返回 -1。
[[nodiscard]] int nibble_(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

constexpr std::string_view kSeparators = ",;:-_|/\\[](){}<>'\"";

[[nodiscard]] bool is_separator_(unsigned char c) noexcept {
    return std::isspace(c) != 0 || kSeparators.find(static_cast<char>(c)) != std::string_view::npos;
}

[[nodiscard]] char printable_(byte b) noexcept {
    return (b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.';
}

void append_line_(std::ostringstream &oss,
                  bytes_view line,
                  std::size_t offset,
                  std::size_t per_line,
                  const HexDumpOptions &options) {
    const bool color = options.enable_color;
    if (options.show_offset) {
        oss << ansi_(color, Ansi::dim) << std::setw(4) << std::setfill('0') << std::hex
            << offset << ": " << ansi_(color, Ansi::reset);
    }

    oss << ansi_(color, Ansi::bytes);
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << std::setw(2) << std::setfill('0') << std::hex << static_cast<int>(line[i]);
    }
    oss << ansi_(color, Ansi::reset);

    if (options.show_ascii) {
        // 不满一行时补齐 "HH " 的宽度，保证 ASCII 列对齐。
        oss << std::string((per_line - line.size()) * 3 + 1, ' ') << "  "
            << ansi_(color, Ansi::ascii);
        for (byte b : line) {
            oss << printable_(b);
        }
        oss << ansi_(color, Ansi::reset);
    }
    oss << '\n';
}

} // namespace

std::string hex_dump(bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t shown = options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line = options.bytes_per_line == 0 ? 16 : options.bytes_per_line;

    std::ostringstream oss;
    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        append_line_(oss, bytes.subspan(offset, std::min(per_line, shown - offset)), offset, per_line,
                     options);
    }
    if (shown < total) {
        oss << ansi_(options.enable_color, Ansi::error) << "... (truncated, total=" << std::dec
            << total << " bytes)" << ansi_(options.enable_color, Ansi::reset) << '\n';
    }
    return oss.str();
}

std::error_code parse_hex(std::string_view text, std::vector<byte> &out) noexcept {
    out.clear();

    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_separator_(c)) {
            continue;
        }
        // 0x/0X 前缀：跳过 'x'，'0' 本身也不计入数据。
        if (c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            continue;
        }
        const int v = nibble_(c);
        if (v < 0) {
            out.clear();
            return make_error_code(errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        out.push_back(static_cast<byte>((high << 4) | v));
        high = -1;
    }

    if (high >= 0) {
        out.clear();
        return make_error_code(errc::invalid_argument);
    }
    return {};
}

std::string bit_string(bytes_view bytes, std::size_t bit_count) {
    bit_count = std::min(bit_count, bytes.size() * 8);
    std::string out;
    out.reserve(bit_count + bit_count / 8);
    for (std::size_t start = 0; start < bit_count; start += 8) {
        if (start != 0) {
            out.push_back(' ');
        }
        const auto b = static_cast<unsigned>(bytes[start / 8]);
        const auto width = static_cast<unsigned>(std::min<std::size_t>(8, bit_count - start));
        for (unsigned i = width; i > 0; --i) {
            out.push_back(((b >> (i - 1)) & 1u) != 0 ? '1' : '0');
        }
    }
    return out;
}

} // namespace bitwire::utils
