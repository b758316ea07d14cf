#include <bitwire/serialize.hpp>
#include <bitwire/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

int main() {
    std::cout << "=== bitwire 编解码简单示例（线格式版本 " << bitwire::core::kFormatVersion
              << "）===\n\n";

    // 有符号整数：zigzag + 变长，-1 只占一个字节
    const auto minus_one = bitwire::encode(std::int32_t{-1});
    std::cout << "int32 -1  -> " << bitwire::utils::bit_string(minus_one) << "\n";

    // 字节序列：长度前缀 + 定长元素
    const std::vector<std::uint8_t> values{5, 0, 255};
    const auto encoded = bitwire::encode(values);
    std::cout << "u8[3]     -> " << bitwire::utils::bit_string(encoded) << "\n";

    std::vector<std::uint8_t> decoded;
    auto ec = bitwire::decode(encoded, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "解码成功: " << decoded.size() << " 个元素\n";

    // 字符串
    const std::string text = "Hello bitwire";
    const auto text_bytes = bitwire::encode(text);
    std::cout << "\nstring 编码 " << text_bytes.size() << " 字节:\n"
              << bitwire::utils::hex_dump(text_bytes);

    std::string text_out;
    ec = bitwire::decode(text_bytes, text_out);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "解码成功: \"" << text_out << "\"\n";

    // 截断输入会被拒绝
    std::vector<bitwire::byte> truncated(text_bytes.begin(), text_bytes.end() - 1);
    ec = bitwire::decode(truncated, text_out);
    std::cout << "\n截断输入: " << ec.message() << "\n";

    return 0;
}
