#pragma once

#include "bitwire/schema/descriptor.hpp"
#include "bitwire/schema/value.hpp"

#include <cstddef>
#include <string>

namespace bitwire::utils {

/**
 * @brief 动态值的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 给出 Descriptor 时按描述标注类型名与字段名（例如 "id: u32 7"）；
 *   值与描述对不上的子树退回无描述格式；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没。
 */
struct ValueDumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // List（序列/结构体）最大输出元素数（0 表示不限制）。
    std::size_t max_list_items{128};

    // 文本/字节最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // List 是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const schema::Value &value, ValueDumpOptions options = {});

[[nodiscard]] std::string dump_value(const schema::Value &value,
                                     const schema::Descriptor &descriptor,
                                     ValueDumpOptions options = {});

} // namespace bitwire::utils
