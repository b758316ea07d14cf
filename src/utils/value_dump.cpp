#include "bitwire/utils/value_dump.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace bitwire::utils {
namespace {

using schema::Descriptor;
using schema::Kind;
using schema::Value;

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *name = "\033[1;36m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    ValueDumpOptions options{};

    [[nodiscard]] const char *color(const char *code) const noexcept {
        return ansi_(options.enable_color, code);
    }
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

// 描述与值的大类一致时才使用描述，否则该子树按无描述格式输出。
[[nodiscard]] const Descriptor *matching_(const Descriptor *d, const Value &value) noexcept {
    if (d == nullptr) {
        return nullptr;
    }
    bool ok = false;
    switch (d->kind()) {
    case Kind::boolean:
        ok = value.get_if<schema::Bool>() != nullptr;
        break;
    case Kind::u8:
    case Kind::u16:
    case Kind::u32:
    case Kind::u64:
        ok = value.get_if<schema::Unsigned>() != nullptr;
        break;
    case Kind::i8:
    case Kind::i16:
    case Kind::i32:
    case Kind::i64:
        ok = value.get_if<schema::Signed>() != nullptr;
        break;
    case Kind::f32:
        ok = value.get_if<schema::F32>() != nullptr;
        break;
    case Kind::f64:
        ok = value.get_if<schema::F64>() != nullptr;
        break;
    case Kind::string:
        ok = value.get_if<schema::Text>() != nullptr;
        break;
    case Kind::bytes:
        ok = value.get_if<schema::Bytes>() != nullptr;
        break;
    case Kind::sequence:
        ok = value.is_list();
        break;
    case Kind::structure: {
        const auto *list = value.get_if<schema::List>();
        ok = list != nullptr && list->size() == d->fields().size();
        break;
    }
    case Kind::optional:
        ok = value.get_if<schema::Optional>() != nullptr;
        break;
    case Kind::variant: {
        const auto *tagged = value.get_if<schema::Tagged>();
        ok = tagged != nullptr && tagged->index < d->fields().size();
        break;
    }
    }
    return ok ? d : nullptr;
}

void append_escaped_(DumpContext &ctx, std::string_view s) {
    const std::size_t max_bytes = ctx.options.max_payload_bytes;
    const std::size_t n = max_bytes == 0 ? s.size() : std::min(s.size(), max_bytes);

    ctx.oss << ctx.color(Ansi::string) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            ctx.oss << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c <= 0x7E) {
            ctx.oss << static_cast<char>(c);
        } else {
            // 控制字符与多字节 UTF-8 的每个字节都按 \xHH 输出，保证日志是纯 ASCII。
            ctx.oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                    << std::dec;
        }
    }
    if (n < s.size()) {
        ctx.oss << "...";
    }
    ctx.oss << '"' << ctx.color(Ansi::reset);
}

void append_bytes_(DumpContext &ctx, const std::vector<byte> &bytes) {
    const std::size_t max_bytes = ctx.options.max_payload_bytes;
    const std::size_t n = max_bytes == 0 ? bytes.size() : std::min(bytes.size(), max_bytes);

    ctx.oss << ctx.color(Ansi::type) << "bytes[" << bytes.size() << ']' << ctx.color(Ansi::reset);
    if (bytes.empty()) {
        return;
    }
    ctx.oss << ' ' << ctx.color(Ansi::value);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            ctx.oss << ' ';
        }
        ctx.oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i])
                << std::dec;
    }
    ctx.oss << ctx.color(Ansi::reset);
    if (n < bytes.size()) {
        ctx.oss << ' ' << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
    }
}

void append_scalar_(DumpContext &ctx, std::string_view type_name, const auto &v) {
    ctx.oss << ctx.color(Ansi::type) << type_name << ctx.color(Ansi::reset) << ' '
            << ctx.color(Ansi::value) << v << ctx.color(Ansi::reset);
}

void append_value_(DumpContext &ctx, const Value &value, const Descriptor *d, std::size_t depth);

void append_list_(DumpContext &ctx, const schema::List &list, const Descriptor *d, std::size_t depth) {
    const auto &opt = ctx.options;
    const bool is_struct = d != nullptr && d->kind() == Kind::structure;
    const std::string_view type_name = d == nullptr ? "list" : schema::kind_name(d->kind());

    const std::size_t total = list.size();
    const std::size_t n = opt.max_list_items == 0 ? total : std::min(total, opt.max_list_items);

    ctx.oss << ctx.color(Ansi::type) << type_name << '[' << total << ']' << ctx.color(Ansi::reset);
    if (total == 0) {
        return;
    }
    if (depth >= opt.max_depth) {
        ctx.oss << ' ' << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
        return;
    }

    auto append_element = [&](std::size_t i) {
        const Descriptor *child = nullptr;
        if (is_struct) {
            const auto &field = d->fields()[i];
            child = field.type.get();
            if (!field.name.empty()) {
                ctx.oss << ctx.color(Ansi::name) << field.name << ctx.color(Ansi::reset) << ": ";
            }
        } else if (d != nullptr) {
            child = d->element().get();
        }
        append_value_(ctx, list[i], child, depth + 1);
    };

    const bool truncated = n < total;
    if (!opt.multiline) {
        ctx.oss << ' ' << ctx.color(Ansi::dim) << "{ " << ctx.color(Ansi::reset);
        for (std::size_t i = 0; i < n; ++i) {
            if (i != 0) {
                ctx.oss << ", ";
            }
            append_element(i);
        }
        if (truncated) {
            ctx.oss << ", " << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
        }
        ctx.oss << ' ' << ctx.color(Ansi::dim) << '}' << ctx.color(Ansi::reset);
        return;
    }

    ctx.oss << ' ' << ctx.color(Ansi::dim) << "{\n" << ctx.color(Ansi::reset);
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces);
        append_element(i);
        ctx.oss << '\n';
    }
    if (truncated) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << ctx.color(Ansi::dim) << "..."
                << ctx.color(Ansi::reset) << '\n';
    }
    ctx.oss << indent_(depth, opt.indent_spaces) << ctx.color(Ansi::dim) << '}' << ctx.color(Ansi::reset);
}

void append_value_(DumpContext &ctx, const Value &value, const Descriptor *d, std::size_t depth) {
    d = matching_(d, value);
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, schema::Bool>) {
                append_scalar_(ctx, "bool", v.value ? "true" : "false");
            } else if constexpr (std::is_same_v<T, schema::Unsigned>) {
                append_scalar_(ctx, d ? schema::kind_name(d->kind()) : "u", v.value);
            } else if constexpr (std::is_same_v<T, schema::Signed>) {
                append_scalar_(ctx, d ? schema::kind_name(d->kind()) : "i", v.value);
            } else if constexpr (std::is_same_v<T, schema::F32>) {
                std::ostringstream num;
                num << std::setprecision(9) << v.value;
                append_scalar_(ctx, "f32", num.str());
            } else if constexpr (std::is_same_v<T, schema::F64>) {
                std::ostringstream num;
                num << std::setprecision(17) << v.value;
                append_scalar_(ctx, "f64", num.str());
            } else if constexpr (std::is_same_v<T, schema::Text>) {
                ctx.oss << ctx.color(Ansi::type) << "string[" << v.value.size() << ']'
                        << ctx.color(Ansi::reset) << ' ';
                append_escaped_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, schema::Bytes>) {
                append_bytes_(ctx, v.value);
            } else if constexpr (std::is_same_v<T, schema::List>) {
                append_list_(ctx, v, d, depth);
            } else if constexpr (std::is_same_v<T, schema::Optional>) {
                if (!v.value) {
                    ctx.oss << ctx.color(Ansi::type) << "none" << ctx.color(Ansi::reset);
                } else if (depth >= ctx.options.max_depth) {
                    ctx.oss << ctx.color(Ansi::type) << "some" << ctx.color(Ansi::reset) << ' '
                            << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
                } else {
                    ctx.oss << ctx.color(Ansi::type) << "some" << ctx.color(Ansi::reset) << ' ';
                    append_value_(ctx, *v.value, d ? d->element().get() : nullptr, depth + 1);
                }
            } else if constexpr (std::is_same_v<T, schema::Tagged>) {
                ctx.oss << ctx.color(Ansi::type) << "variant#" << v.index << ctx.color(Ansi::reset);
                const schema::Field *alt = d ? &d->fields()[v.index] : nullptr;
                if (alt != nullptr && !alt->name.empty()) {
                    ctx.oss << ' ' << ctx.color(Ansi::name) << alt->name << ctx.color(Ansi::reset);
                }
                if (!v.value) {
                    return;
                }
                if (depth >= ctx.options.max_depth) {
                    ctx.oss << ' ' << ctx.color(Ansi::dim) << "..." << ctx.color(Ansi::reset);
                    return;
                }
                ctx.oss << ' ';
                append_value_(ctx, *v.value, alt ? alt->type.get() : nullptr, depth + 1);
            }
        },
        value.storage());
}

} // namespace

std::string dump_value(const Value &value, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;
    append_value_(ctx, value, nullptr, 0);
    return ctx.oss.str();
}

std::string dump_value(const Value &value, const Descriptor &descriptor, ValueDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;
    append_value_(ctx, value, &descriptor, 0);
    return ctx.oss.str();
}

} // namespace bitwire::utils
