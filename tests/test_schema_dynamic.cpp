#include "bitwire/schema/dynamic.hpp"
#include "bitwire/serialize.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using bitwire::BitBuffer;
using bitwire::byte;
using bitwire::errc;
using bitwire::schema::Descriptor;
using bitwire::schema::DescriptorPtr;
using bitwire::schema::Field;
using bitwire::schema::Kind;
using bitwire::schema::Value;

struct Reading {
  std::uint16_t sensor{};
  std::int32_t delta{};
  std::optional<std::string> label;
  std::vector<std::int8_t> samples;
  float gain{};
  BITWIRE_FIELDS(sensor, delta, label, samples, gain)
};

using Event = std::variant<std::monostate, Reading, std::vector<std::uint8_t>>;

DescriptorPtr reading_descriptor() {
  return Descriptor::structure({
    {"sensor", Descriptor::u16()},
    {"delta", Descriptor::i32()},
    {"label", Descriptor::optional(Descriptor::string())},
    {"samples", Descriptor::sequence(Descriptor::i8())},
    {"gain", Descriptor::f32()},
  });
}

DescriptorPtr event_descriptor() {
  return Descriptor::variant({
    {"idle", Descriptor::structure({})},
    {"reading", reading_descriptor()},
    {"raw", Descriptor::bytes()},
  });
}

Value reading_value() {
  return Value::list({
    Value::u(513),
    Value::i(-300),
    Value::some(Value::string("thermo-\xC3\xA9")),
    Value::list({Value::i(-128), Value::i(0), Value::i(127)}),
    Value::f32(0.5f),
  });
}

Reading reading_struct() {
  Reading r;
  r.sensor = 513;
  r.delta = -300;
  r.label = "thermo-\xC3\xA9";
  r.samples = {-128, 0, 127};
  r.gain = 0.5f;
  return r;
}

std::vector<byte> encode_dynamic(const DescriptorPtr& d, const Value& v) {
  std::vector<byte> out;
  TEST_EXPECT_OK(bitwire::schema::encode_value(*d, v, out));
  return out;
}

void test_descriptor_properties() {
  auto d = event_descriptor();
  TEST_EXPECT(d->kind() == Kind::variant);
  TEST_EXPECT_EQ(d->fields().size(), 3u);
  TEST_EXPECT_EQ(d->tag_bits(), 2u);
  TEST_EXPECT_EQ(d->min_bits(), 2u);
  TEST_EXPECT_EQ(bitwire::schema::kind_name(Kind::structure), "struct");

  TEST_EXPECT(Descriptor::i16()->is_signed_integer());
  TEST_EXPECT(!Descriptor::i16()->is_unsigned_integer());
  TEST_EXPECT_EQ(Descriptor::u64()->integer_bits(), 64u);
  TEST_EXPECT_EQ(Descriptor::string()->integer_bits(), 0u);
  TEST_EXPECT_EQ(reading_descriptor()->min_bits(), 16u + 8u + 1u + 8u + 32u);
  TEST_EXPECT(Descriptor::sequence(Descriptor::u8())->element() != nullptr);
}

void test_matches_static_encoding() {
  TEST_EXPECT_EQ(encode_dynamic(reading_descriptor(), reading_value()),
                 bitwire::encode(reading_struct()));

  TEST_EXPECT_EQ(encode_dynamic(event_descriptor(), Value::tagged(1, reading_value())),
                 bitwire::encode(Event{reading_struct()}));
  TEST_EXPECT_EQ(encode_dynamic(event_descriptor(), Value::tagged(0, Value::list({}))),
                 bitwire::encode(Event{}));
  TEST_EXPECT_EQ(encode_dynamic(event_descriptor(), Value::tagged(2, Value::bytes({5, 0, 255}))),
                 bitwire::encode(Event{std::vector<std::uint8_t>{5, 0, 255}}));

  TEST_EXPECT_EQ(encode_dynamic(Descriptor::i64(), Value::i(-1)), (std::vector<byte>{0x01}));
  TEST_EXPECT_EQ(encode_dynamic(Descriptor::sequence(Descriptor::u8()),
                                Value::list({Value::u(5), Value::u(0), Value::u(255)})),
                 (std::vector<byte>{0x03, 0x05, 0x00, 0xFF}));
  TEST_EXPECT_EQ(encode_dynamic(Descriptor::f64(), Value::f64(-2.5)), bitwire::encode(-2.5));
  TEST_EXPECT_EQ(encode_dynamic(Descriptor::boolean(), Value::boolean(true)), bitwire::encode(true));
}

void test_dynamic_decodes_static_bytes() {
  const auto bytes = bitwire::encode(Event{reading_struct()});
  Value out = Value::none();
  TEST_EXPECT_OK(bitwire::schema::decode_value(*event_descriptor(), bytes, out));
  TEST_EXPECT(out == Value::tagged(1, reading_value()));

  // 反方向：动态编码的字节由静态类型解码。
  Event back;
  TEST_EXPECT_OK(bitwire::decode(encode_dynamic(event_descriptor(), out), back));
  TEST_EXPECT(std::holds_alternative<Reading>(back));
  TEST_EXPECT_EQ(std::get<Reading>(back).delta, -300);
  TEST_EXPECT(std::get<Reading>(back).label == std::optional<std::string>("thermo-\xC3\xA9"));
}

void test_schema_mismatch() {
  std::vector<byte> out{0xAA};
  auto u8 = Descriptor::u8();
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*u8, Value::u(256), out), errc::schema_mismatch);
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*u8, Value::i(1), out), errc::schema_mismatch);
  TEST_EXPECT_EQ(out, (std::vector<byte>{0xAA}));

  auto i8 = Descriptor::i8();
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*i8, Value::i(-129), out), errc::schema_mismatch);
  TEST_EXPECT_OK(bitwire::schema::encode_value(*i8, Value::i(-128), out));

  auto s = reading_descriptor();
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*s, Value::list({Value::u(1)}), out),
                    errc::schema_mismatch);

  auto v = event_descriptor();
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*v, Value::tagged(3, Value::list({})), out),
                    errc::schema_mismatch);
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*v, Value::u(1), out), errc::schema_mismatch);

  auto opt = Descriptor::optional(Descriptor::string());
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*opt, Value::string("bare"), out),
                    errc::schema_mismatch);
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*opt, Value::some(Value::u(1)), out),
                    errc::schema_mismatch);
}

void test_missing_child_descriptor() {
  auto broken = Descriptor::sequence(nullptr);
  std::vector<byte> out;
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*broken, Value::list({}), out), errc::invalid_argument);

  Value value = Value::none();
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*broken, std::vector<byte>{0x00}, value),
                    errc::invalid_argument);

  auto field = Descriptor::structure({{"x", nullptr}});
  TEST_EXPECT_ERROR(bitwire::schema::encode_value(*field, Value::list({Value::u(1)}), out),
                    errc::invalid_argument);
}

void test_decode_errors() {
  Value out = Value::u(7);

  // 截断
  auto bytes = encode_dynamic(reading_descriptor(), reading_value());
  bytes.pop_back();
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*reading_descriptor(), bytes, out), errc::unexpected_end);
  TEST_EXPECT(out == Value::u(7));

  // 非法判别值
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*event_descriptor(), std::vector<byte>{0x03}, out),
                    errc::invalid_variant);

  // 非法 UTF-8
  TEST_EXPECT_ERROR(
    bitwire::schema::decode_value(*Descriptor::string(), std::vector<byte>{0x02, 0xC3, 0x28}, out),
    errc::invalid_utf8);

  // i8 的变长编码超出 8 位
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*Descriptor::i8(), std::vector<byte>{0xFF, 0x03}, out),
                    errc::malformed_varint);

  // 尾随整字节
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*Descriptor::u8(), std::vector<byte>{0x01, 0x02}, out),
                    errc::trailing_data);
  bitwire::DecodeOptions lenient;
  lenient.allow_trailing_bytes = true;
  TEST_EXPECT_OK(bitwire::schema::decode_value(*Descriptor::u8(), std::vector<byte>{0x01, 0x02}, out, lenient));
  TEST_EXPECT(out == Value::u(1));

  // 序列长度上限
  bitwire::DecodeOptions limited;
  limited.max_sequence_length = 2;
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*Descriptor::sequence(Descriptor::u8()),
                                                  std::vector<byte>{0x03, 1, 2, 3}, out, limited),
                    errc::length_overflow);
}

// 任何严格前缀都以 unexpected_end 失败，且 out 保持不变。
void expect_dynamic_prefixes_truncated(const DescriptorPtr& d, const Value& value) {
  const auto bytes = encode_dynamic(d, value);
  for (std::size_t n = 0; n < bytes.size(); ++n) {
    Value out = Value::u(7);
    TEST_EXPECT_ERROR(bitwire::schema::decode_value(*d, bitwire::bytes_view{bytes.data(), n}, out),
                      errc::unexpected_end);
    TEST_EXPECT(out == Value::u(7));
  }
}

void test_truncated_prefixes() {
  expect_dynamic_prefixes_truncated(reading_descriptor(), reading_value());
  expect_dynamic_prefixes_truncated(event_descriptor(), Value::tagged(1, reading_value()));
  expect_dynamic_prefixes_truncated(event_descriptor(),
                                    Value::tagged(2, Value::bytes({0x01, 0x02, 0x03})));
  expect_dynamic_prefixes_truncated(Descriptor::sequence(Descriptor::optional(Descriptor::i64())),
                                    Value::list({Value::some(Value::i(-1)), Value::none(),
                                                 Value::some(Value::i(1LL << 40))}));
}

// 空结构体序列：4 字节的长度前缀不能让解码构造上千万个元素。
void test_zero_bit_element_sequences() {
  auto empties = Descriptor::sequence(Descriptor::structure({}));
  TEST_EXPECT_EQ(empties->element()->min_bits(), 0u);

  BitBuffer lying;
  bitwire::codec::write_length(lying, bitwire::core::kDefaultMaxSequenceLength - 1);
  const auto bytes = lying.finish();

  Value out = Value::u(7);
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*empties, bytes, out), errc::length_overflow);
  TEST_EXPECT(out == Value::u(7));

  std::vector<Value> allowed(4096, Value::list({}));
  const auto allowed_bytes = encode_dynamic(empties, Value::list(allowed));
  TEST_EXPECT_OK(bitwire::schema::decode_value(*empties, allowed_bytes, out));
  TEST_EXPECT(out == Value::list(allowed));

  allowed.push_back(Value::list({}));
  const auto too_many = encode_dynamic(empties, Value::list(std::move(allowed)));
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*empties, too_many, out), errc::length_overflow);

  // 与静态路径一致：std::vector<std::monostate> 的同一输入得到同样的错误。
  std::vector<std::monostate> states;
  TEST_EXPECT_ERROR(bitwire::decode(bytes, states), errc::length_overflow);
}

void test_invalid_utf8_offset() {
  auto d = reading_descriptor();
  Value bad = Value::list({
    Value::u(1),
    Value::i(0),
    Value::some(Value::string("abcd\xF5\x80")),
    Value::list({}),
    Value::f32(1.0f),
  });
  const auto bytes = encode_dynamic(d, bad);

  auto buf = BitBuffer::from_bytes(bytes);
  Value out = Value::none();
  TEST_EXPECT_ERROR(bitwire::schema::decode(*d, buf, out), errc::invalid_utf8);
  TEST_EXPECT_EQ(buf.invalid_utf8_offset(), std::optional<std::size_t>{4});
  TEST_EXPECT(out == Value::none());
}

void test_depth_limit() {
  DescriptorPtr nested = Descriptor::u8();
  Value value = Value::u(9);
  for (int i = 0; i < 10; ++i) {
    nested = Descriptor::optional(nested);
    value = Value::some(value);
  }
  const auto bytes = encode_dynamic(nested, value);

  Value out = Value::none();
  bitwire::DecodeOptions options;
  options.max_depth = 10;
  TEST_EXPECT_OK(bitwire::schema::decode_value(*nested, bytes, out, options));
  TEST_EXPECT(out == value);

  options.max_depth = 9;
  TEST_EXPECT_ERROR(bitwire::schema::decode_value(*nested, bytes, out, options), errc::depth_exceeded);

  // 缓冲区级 API 直接接收深度上限。
  auto buf = BitBuffer::from_bytes(bytes);
  TEST_EXPECT_ERROR(bitwire::schema::decode(*nested, buf, out, 3), errc::depth_exceeded);
}

void test_value_equality() {
  TEST_EXPECT(Value::f32(std::numeric_limits<float>::quiet_NaN()) ==
              Value::f32(std::numeric_limits<float>::quiet_NaN()));
  TEST_EXPECT(Value::f64(0.0) != Value::f64(-0.0));
  TEST_EXPECT(Value::u(1) != Value::i(1));
  TEST_EXPECT(Value::none() != Value::some(Value::none()));
  TEST_EXPECT(Value::tagged(0, Value::u(1)) != Value::tagged(1, Value::u(1)));
  TEST_EXPECT(Value::list({Value::string("a")}) == Value::list({Value::string("a")}));

  const Value text = Value::string("abc");
  TEST_EXPECT(text.get_if<bitwire::schema::Text>() != nullptr);
  TEST_EXPECT(text.get_if<bitwire::schema::Bytes>() == nullptr);
  TEST_EXPECT_EQ(text.get_if<bitwire::schema::Text>()->value, "abc");
}

}  // namespace

int main() {
  test_descriptor_properties();
  test_matches_static_encoding();
  test_dynamic_decodes_static_bytes();
  test_schema_mismatch();
  test_missing_child_descriptor();
  test_decode_errors();
  test_truncated_prefixes();
  test_zero_bit_element_sequences();
  test_invalid_utf8_offset();
  test_depth_limit();
  test_value_equality();
  return ::bitwire::tests::run_and_report();
}
