#include "bitwire/schema/descriptor.hpp"

#include "bitwire/codec/primitive.hpp"
#include "bitwire/codec/varint.hpp"

#include <utility>

namespace bitwire::schema {
std::string_view kind_name(Kind kind) noexcept {
  switch (kind) {
    case Kind::boolean:
      return "bool";
    case Kind::u8:
      return "u8";
    case Kind::u16:
      return "u16";
    case Kind::u32:
      return "u32";
    case Kind::u64:
      return "u64";
    case Kind::i8:
      return "i8";
    case Kind::i16:
      return "i16";
    case Kind::i32:
      return "i32";
    case Kind::i64:
      return "i64";
    case Kind::f32:
      return "f32";
    case Kind::f64:
      return "f64";
    case Kind::string:
      return "string";
    case Kind::bytes:
      return "bytes";
    case Kind::sequence:
      return "sequence";
    case Kind::optional:
      return "optional";
    case Kind::structure:
      return "struct";
    case Kind::variant:
      return "variant";
  }
  return "unknown";
}

Descriptor::Descriptor(Kind kind, DescriptorPtr element, std::vector<Field> fields)
    : kind_(kind), element_(std::move(element)), fields_(std::move(fields)) {}

// 构造函数是私有的，make_shared 无法直接使用。
DescriptorPtr Descriptor::make_(Kind kind, DescriptorPtr element, std::vector<Field> fields) {
  return DescriptorPtr(new Descriptor(kind, std::move(element), std::move(fields)));
}

DescriptorPtr Descriptor::boolean() { return make_(Kind::boolean, nullptr, {}); }
DescriptorPtr Descriptor::u8() { return make_(Kind::u8, nullptr, {}); }
DescriptorPtr Descriptor::u16() { return make_(Kind::u16, nullptr, {}); }
DescriptorPtr Descriptor::u32() { return make_(Kind::u32, nullptr, {}); }
DescriptorPtr Descriptor::u64() { return make_(Kind::u64, nullptr, {}); }
DescriptorPtr Descriptor::i8() { return make_(Kind::i8, nullptr, {}); }
DescriptorPtr Descriptor::i16() { return make_(Kind::i16, nullptr, {}); }
DescriptorPtr Descriptor::i32() { return make_(Kind::i32, nullptr, {}); }
DescriptorPtr Descriptor::i64() { return make_(Kind::i64, nullptr, {}); }
DescriptorPtr Descriptor::f32() { return make_(Kind::f32, nullptr, {}); }
DescriptorPtr Descriptor::f64() { return make_(Kind::f64, nullptr, {}); }
DescriptorPtr Descriptor::string() { return make_(Kind::string, nullptr, {}); }
DescriptorPtr Descriptor::bytes() { return make_(Kind::bytes, nullptr, {}); }

DescriptorPtr Descriptor::sequence(DescriptorPtr element) {
  return make_(Kind::sequence, std::move(element), {});
}

DescriptorPtr Descriptor::optional(DescriptorPtr inner) {
  return make_(Kind::optional, std::move(inner), {});
}

DescriptorPtr Descriptor::structure(std::vector<Field> fields) {
  return make_(Kind::structure, nullptr, std::move(fields));
}

DescriptorPtr Descriptor::variant(std::vector<Field> alternatives) {
  return make_(Kind::variant, nullptr, std::move(alternatives));
}

unsigned Descriptor::tag_bits() const noexcept {
  if (kind_ != Kind::variant) {
    return 0;
  }
  return codec::bits_for_count(fields_.size());
}

bool Descriptor::is_unsigned_integer() const noexcept {
  return kind_ == Kind::u8 || kind_ == Kind::u16 || kind_ == Kind::u32 || kind_ == Kind::u64;
}

bool Descriptor::is_signed_integer() const noexcept {
  return kind_ == Kind::i8 || kind_ == Kind::i16 || kind_ == Kind::i32 || kind_ == Kind::i64;
}

unsigned Descriptor::integer_bits() const noexcept {
  switch (kind_) {
    case Kind::u8:
    case Kind::i8:
      return 8;
    case Kind::u16:
    case Kind::i16:
      return 16;
    case Kind::u32:
    case Kind::i32:
      return 32;
    case Kind::u64:
    case Kind::i64:
      return 64;
    default:
      return 0;
  }
}

std::size_t Descriptor::min_bits() const noexcept {
  switch (kind_) {
    case Kind::boolean:
    case Kind::optional:
      return 1;
    case Kind::u8:
    case Kind::u16:
    case Kind::u32:
    case Kind::u64:
      return integer_bits();
    case Kind::f32:
      return 32;
    case Kind::f64:
      return 64;
    case Kind::i8:
    case Kind::i16:
    case Kind::i32:
    case Kind::i64:
    case Kind::string:
    case Kind::bytes:
    case Kind::sequence:
      return codec::kVarintGroupBits;
    case Kind::structure: {
      std::size_t total = 0;
      for (const auto& field : fields_) {
        if (field.type) {
          total += field.type->min_bits();
        }
      }
      return total;
    }
    case Kind::variant:
      return tag_bits();
  }
  return 0;
}

}  // namespace bitwire::schema
