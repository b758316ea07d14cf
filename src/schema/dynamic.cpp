#include "bitwire/schema/dynamic.hpp"

#include "bitwire/codec/primitive.hpp"
#include "bitwire/codec/string.hpp"
#include "bitwire/codec/varint.hpp"
#include "bitwire/core/error.hpp"
#include "bitwire/serialize.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <utility>

namespace bitwire::schema {
namespace {

[[nodiscard]] std::error_code mismatch() noexcept {
  return make_error_code(errc::schema_mismatch);
}

[[nodiscard]] std::error_code missing_child() noexcept {
  return make_error_code(errc::invalid_argument);
}

[[nodiscard]] bool is_composite(Kind kind) noexcept {
  return kind == Kind::sequence || kind == Kind::optional || kind == Kind::structure ||
         kind == Kind::variant;
}

// ---- 编码 ----

std::error_code encode_unsigned(const Descriptor& d, const Value& value, BitBuffer& buf) {
  const auto* v = value.get_if<Unsigned>();
  if (!v) {
    return mismatch();
  }
  const unsigned bits = d.integer_bits();
  if (bits < 64 && v->value > ((std::uint64_t{1} << bits) - 1u)) {
    return mismatch();
  }
  // 与 Codec<std::uint*_t> 的定长编码一致：低位优先写满位宽。
  buf.write_bits(v->value, bits);
  return {};
}

template <std::signed_integral S>
std::error_code encode_signed_as(std::int64_t value, BitBuffer& buf) {
  if (value < std::numeric_limits<S>::min() || value > std::numeric_limits<S>::max()) {
    return mismatch();
  }
  codec::write_zigzag(buf, static_cast<S>(value));
  return {};
}

std::error_code encode_signed(const Descriptor& d, const Value& value, BitBuffer& buf) {
  const auto* v = value.get_if<Signed>();
  if (!v) {
    return mismatch();
  }
  switch (d.kind()) {
    case Kind::i8:
      return encode_signed_as<std::int8_t>(v->value, buf);
    case Kind::i16:
      return encode_signed_as<std::int16_t>(v->value, buf);
    case Kind::i32:
      return encode_signed_as<std::int32_t>(v->value, buf);
    default:
      return encode_signed_as<std::int64_t>(v->value, buf);
  }
}

std::error_code encode_node(const Descriptor& d, const Value& value, BitBuffer& buf);

std::error_code encode_child(const DescriptorPtr& d, const Value& value, BitBuffer& buf) {
  if (!d) {
    return missing_child();
  }
  return encode_node(*d, value, buf);
}

std::error_code encode_node(const Descriptor& d, const Value& value, BitBuffer& buf) {
  switch (d.kind()) {
    case Kind::boolean: {
      const auto* v = value.get_if<Bool>();
      if (!v) {
        return mismatch();
      }
      codec::write_bool(buf, v->value);
      return {};
    }
    case Kind::u8:
    case Kind::u16:
    case Kind::u32:
    case Kind::u64:
      return encode_unsigned(d, value, buf);
    case Kind::i8:
    case Kind::i16:
    case Kind::i32:
    case Kind::i64:
      return encode_signed(d, value, buf);
    case Kind::f32: {
      const auto* v = value.get_if<F32>();
      if (!v) {
        return mismatch();
      }
      codec::write_f32(buf, v->value);
      return {};
    }
    case Kind::f64: {
      const auto* v = value.get_if<F64>();
      if (!v) {
        return mismatch();
      }
      codec::write_f64(buf, v->value);
      return {};
    }
    case Kind::string: {
      const auto* v = value.get_if<Text>();
      if (!v) {
        return mismatch();
      }
      codec::write_string(buf, v->value);
      return {};
    }
    case Kind::bytes: {
      const auto* v = value.get_if<Bytes>();
      if (!v) {
        return mismatch();
      }
      codec::write_byte_string(buf, bytes_view{v->value.data(), v->value.size()});
      return {};
    }
    case Kind::sequence: {
      const auto* v = value.get_if<List>();
      if (!v) {
        return mismatch();
      }
      if (!d.element()) {
        return missing_child();
      }
      codec::write_length(buf, v->size());
      for (const auto& element : *v) {
        auto ec = encode_node(*d.element(), element, buf);
        if (ec) {
          return ec;
        }
      }
      return {};
    }
    case Kind::optional: {
      const auto* v = value.get_if<Optional>();
      if (!v) {
        return mismatch();
      }
      if (!d.element()) {
        return missing_child();
      }
      buf.write_bit(v->value != nullptr);
      if (!v->value) {
        return {};
      }
      return encode_node(*d.element(), *v->value, buf);
    }
    case Kind::structure: {
      const auto* v = value.get_if<List>();
      if (!v || v->size() != d.fields().size()) {
        return mismatch();
      }
      for (std::size_t i = 0; i < v->size(); ++i) {
        auto ec = encode_child(d.fields()[i].type, (*v)[i], buf);
        if (ec) {
          return ec;
        }
      }
      return {};
    }
    case Kind::variant: {
      const auto* v = value.get_if<Tagged>();
      if (!v || v->index >= d.fields().size() || !v->value) {
        return mismatch();
      }
      buf.write_bits(static_cast<std::uint64_t>(v->index), d.tag_bits());
      return encode_child(d.fields()[v->index].type, *v->value, buf);
    }
  }
  return mismatch();
}

// ---- 解码 ----

struct DecodeContext final {
  BitBuffer& buf;
  std::size_t max_depth;
};

std::error_code decode_unsigned(const Descriptor& d, BitBuffer& buf, Value& out) {
  std::uint64_t v = 0;
  auto ec = buf.read_bits(d.integer_bits(), v);
  if (ec) {
    return ec;
  }
  out = Value::u(v);
  return {};
}

template <std::signed_integral S>
std::error_code decode_signed_as(BitBuffer& buf, Value& out) {
  S v{};
  auto ec = codec::read_zigzag(buf, v);
  if (ec) {
    return ec;
  }
  out = Value::i(static_cast<std::int64_t>(v));
  return {};
}

std::error_code decode_signed(const Descriptor& d, BitBuffer& buf, Value& out) {
  switch (d.kind()) {
    case Kind::i8:
      return decode_signed_as<std::int8_t>(buf, out);
    case Kind::i16:
      return decode_signed_as<std::int16_t>(buf, out);
    case Kind::i32:
      return decode_signed_as<std::int32_t>(buf, out);
    default:
      return decode_signed_as<std::int64_t>(buf, out);
  }
}

std::error_code decode_node(DecodeContext& ctx, const Descriptor& d, Value& out, std::size_t depth);

std::error_code decode_child(DecodeContext& ctx, const DescriptorPtr& d, Value& out, std::size_t depth) {
  if (!d) {
    return missing_child();
  }
  return decode_node(ctx, *d, out, depth);
}

std::error_code decode_sequence(DecodeContext& ctx, const Descriptor& d, Value& out, std::size_t depth) {
  if (!d.element()) {
    return missing_child();
  }
  auto& buf = ctx.buf;
  std::size_t length = 0;
  auto ec = codec::read_length(buf, length);
  if (ec) {
    return ec;
  }
  // 与 Codec<std::vector<T>> 相同：长度前缀明显超出剩余输入时不做分配。
  const std::size_t per_element = d.element()->min_bits();
  if (per_element > 0 && length > buf.remaining_bits() / per_element) {
    return make_error_code(errc::unexpected_end);
  }
  if (per_element == 0 && length > buf.remaining_bits() + detail::kMaxZeroBitElements) {
    return make_error_code(errc::length_overflow);
  }
  std::vector<Value> values;
  values.reserve(per_element > 0 ? length : std::min(length, detail::kMaxZeroBitElements));
  for (std::size_t i = 0; i < length; ++i) {
    Value element = Value::none();
    ec = decode_node(ctx, *d.element(), element, depth + 1);
    if (ec) {
      return ec;
    }
    values.push_back(std::move(element));
  }
  out = Value::list(std::move(values));
  return {};
}

std::error_code decode_node(DecodeContext& ctx, const Descriptor& d, Value& out, std::size_t depth) {
  if (is_composite(d.kind()) && depth >= ctx.max_depth) {
    return make_error_code(errc::depth_exceeded);
  }
  auto& buf = ctx.buf;
  switch (d.kind()) {
    case Kind::boolean: {
      bool v = false;
      auto ec = codec::read_bool(buf, v);
      if (ec) {
        return ec;
      }
      out = Value::boolean(v);
      return {};
    }
    case Kind::u8:
    case Kind::u16:
    case Kind::u32:
    case Kind::u64:
      return decode_unsigned(d, buf, out);
    case Kind::i8:
    case Kind::i16:
    case Kind::i32:
    case Kind::i64:
      return decode_signed(d, buf, out);
    case Kind::f32: {
      float v = 0;
      auto ec = codec::read_f32(buf, v);
      if (ec) {
        return ec;
      }
      out = Value::f32(v);
      return {};
    }
    case Kind::f64: {
      double v = 0;
      auto ec = codec::read_f64(buf, v);
      if (ec) {
        return ec;
      }
      out = Value::f64(v);
      return {};
    }
    case Kind::string: {
      std::string v;
      auto ec = codec::read_string(buf, v);
      if (ec) {
        return ec;
      }
      out = Value::string(std::move(v));
      return {};
    }
    case Kind::bytes: {
      std::vector<byte> v;
      auto ec = codec::read_byte_string(buf, v);
      if (ec) {
        return ec;
      }
      out = Value::bytes(std::move(v));
      return {};
    }
    case Kind::sequence:
      return decode_sequence(ctx, d, out, depth);
    case Kind::optional: {
      if (!d.element()) {
        return missing_child();
      }
      bool present = false;
      auto ec = buf.read_bit(present);
      if (ec) {
        return ec;
      }
      if (!present) {
        out = Value::none();
        return {};
      }
      Value inner = Value::none();
      ec = decode_node(ctx, *d.element(), inner, depth + 1);
      if (ec) {
        return ec;
      }
      out = Value::some(std::move(inner));
      return {};
    }
    case Kind::structure: {
      std::vector<Value> values;
      values.reserve(d.fields().size());
      for (const auto& field : d.fields()) {
        Value v = Value::none();
        auto ec = decode_child(ctx, field.type, v, depth + 1);
        if (ec) {
          return ec;
        }
        values.push_back(std::move(v));
      }
      out = Value::list(std::move(values));
      return {};
    }
    case Kind::variant: {
      const auto& alternatives = d.fields();
      std::uint64_t tag = 0;
      auto ec = buf.read_bits(d.tag_bits(), tag);
      if (ec) {
        return ec;
      }
      if (tag >= alternatives.size()) {
        return make_error_code(errc::invalid_variant);
      }
      const auto index = static_cast<std::size_t>(tag);
      Value inner = Value::none();
      ec = decode_child(ctx, alternatives[index].type, inner, depth + 1);
      if (ec) {
        return ec;
      }
      out = Value::tagged(index, std::move(inner));
      return {};
    }
  }
  return make_error_code(errc::invalid_argument);
}

}  // namespace

std::error_code encode(const Descriptor& descriptor, const Value& value, BitBuffer& buf) {
  return encode_node(descriptor, value, buf);
}

std::error_code decode(const Descriptor& descriptor, BitBuffer& buf, Value& out, std::size_t max_depth) {
  DecodeContext ctx{buf, max_depth};
  Value value = Value::none();
  auto ec = decode_node(ctx, descriptor, value, 0);
  if (ec) {
    return ec;
  }
  out = std::move(value);
  return {};
}

std::error_code encode_value(const Descriptor& descriptor,
                             const Value& value,
                             std::vector<byte>& out,
                             EncodeOptions options) {
  BitBuffer buf(options.initial_capacity);
  auto ec = encode_node(descriptor, value, buf);
  if (ec) {
    return ec;
  }
  out = buf.finish();
  return {};
}

std::error_code decode_value(const Descriptor& descriptor,
                             bytes_view bytes,
                             Value& out,
                             DecodeOptions options) {
  auto buf = BitBuffer::from_bytes(bytes);
  buf.set_max_sequence_length(options.max_sequence_length);
  Value value = Value::none();
  auto ec = bitwire::detail::finish_decode(buf, schema::decode(descriptor, buf, value, options.max_depth), options);
  if (ec) {
    return ec;
  }
  out = std::move(value);
  return {};
}

}  // namespace bitwire::schema
