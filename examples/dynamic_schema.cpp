/**
 * @file dynamic_schema.cpp
 * @brief 演示运行时描述符（Descriptor）+ 动态值（Value）的编解码与可读输出
 *
 * 运行：
 * - 无参数：编码内置的传感器读数，再解码并打印；
 * - 指定十六进制输入：./build/examples/dynamic_schema "<hex>"
 *   按同一描述符解码并打印（解码失败时打印错误）。
 */

#include <bitwire/schema/descriptor.hpp>
#include <bitwire/schema/dynamic.hpp>
#include <bitwire/schema/value.hpp>
#include <bitwire/utils/hex.hpp>
#include <bitwire/utils/value_dump.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace bitwire;
using schema::Descriptor;
using schema::Value;

namespace {

schema::DescriptorPtr reading_descriptor() {
    auto unit = Descriptor::variant({{"celsius", Descriptor::f32()},
                                     {"raw", Descriptor::u16()}});
    return Descriptor::structure({{"sensor", Descriptor::string()},
                                  {"channel", Descriptor::u8()},
                                  {"offset", Descriptor::i32()},
                                  {"samples", Descriptor::sequence(unit)},
                                  {"comment", Descriptor::optional(Descriptor::string())}});
}

Value sample_reading() {
    return Value::list({
        Value::string("thermo-7"),
        Value::u(3),
        Value::i(-12),
        Value::list({Value::tagged(0, Value::f32(21.5f)), Value::tagged(1, Value::u(4095))}),
        Value::none(),
    });
}

int decode_and_print(const Descriptor& desc, bytes_view bytes) {
    Value out = Value::boolean(false);
    const auto ec = schema::decode_value(desc, bytes, out);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << utils::dump_value(out, desc) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const auto desc = reading_descriptor();

    if (argc > 1) {
        std::vector<byte> bytes;
        if (utils::parse_hex(argv[1], bytes)) {
            std::cerr << "十六进制输入无效\n";
            return 2;
        }
        return decode_and_print(*desc, bytes);
    }

    std::cout << "=== bitwire 动态 schema 示例 ===\n\n";

    const auto value = sample_reading();
    std::vector<byte> bytes;
    const auto ec = schema::encode_value(*desc, value, bytes);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "编码 " << bytes.size() << " 字节:\n" << utils::hex_dump(bytes) << "\n";

    // 值与描述符不匹配时返回 schema_mismatch
    std::vector<byte> rejected;
    const auto mismatch = schema::encode_value(*desc, Value::u(1), rejected);
    std::cout << "不匹配的值: " << mismatch.message() << "\n\n";

    return decode_and_print(*desc, bytes);
}
