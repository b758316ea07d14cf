#include "bitwire/serialize.hpp"
#include "bitwire/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

using bitwire::byte;
using bitwire::bytes_view;
using bitwire::errc;

struct Header {
  std::uint8_t version{};
  bool compressed{};
  bool encrypted{};
  BITWIRE_FIELDS(version, compressed, encrypted)
  friend bool operator==(const Header&, const Header&) = default;
};

struct Snapshot {
  Header header;
  std::uint64_t tick{};
  std::map<std::string, std::int32_t> scores;
  std::optional<std::vector<std::uint8_t>> blob;
  BITWIRE_FIELDS(header, tick, scores, blob)
  friend bool operator==(const Snapshot&, const Snapshot&) = default;
};

Snapshot sample_snapshot() {
  Snapshot s;
  s.header = {1, true, false};
  s.tick = 123456789;
  s.scores = {{"alice", 10}, {"bob", -3}};
  s.blob = std::vector<std::uint8_t>{0xDE, 0xAD};
  return s;
}

void test_signed_minus_one_scenario() {
  const auto bytes = bitwire::encode(std::int32_t{-1});
  TEST_EXPECT_EQ(bytes, (std::vector<byte>{0x01}));
  std::int32_t out = 0;
  TEST_EXPECT_OK(bitwire::decode(bytes, out));
  TEST_EXPECT_EQ(out, -1);
}

void test_byte_sequence_scenario() {
  const std::vector<std::uint8_t> value{5, 0, 255};
  const auto bytes = bitwire::encode(value);
  TEST_EXPECT_EQ(bitwire::utils::bit_string(bytes), "00000011 00000101 00000000 11111111");
  std::vector<std::uint8_t> out;
  TEST_EXPECT_OK(bitwire::decode(bytes, out));
  TEST_EXPECT_EQ(out, value);
}

void test_snapshot_roundtrip() {
  const auto snapshot = sample_snapshot();
  const auto bytes = bitwire::encode(snapshot);
  Snapshot out;
  TEST_EXPECT_OK(bitwire::decode(bytes, out));
  TEST_EXPECT(out == snapshot);

  // 头部 10 位之后的字段不再字节对齐。
  const auto header_bytes = bitwire::encode(snapshot.header);
  TEST_EXPECT_EQ(header_bytes, (std::vector<byte>{0x01, 0x01}));
}

void test_padding_is_not_trailing_data() {
  const auto bytes = bitwire::encode(Header{3, false, true});
  TEST_EXPECT_EQ(bytes.size(), 2u);
  Header out;
  TEST_EXPECT_OK(bitwire::decode(bytes, out));
  TEST_EXPECT(out == (Header{3, false, true}));
}

void test_trailing_bytes() {
  auto bytes = bitwire::encode(std::uint16_t{7});
  bytes.push_back(0x00);

  std::uint16_t out = 1;
  TEST_EXPECT_ERROR(bitwire::decode(bytes, out), errc::trailing_data);
  TEST_EXPECT_EQ(out, 1u);

  bitwire::DecodeOptions options;
  options.allow_trailing_bytes = true;
  TEST_EXPECT_OK(bitwire::decode(bytes, out, options));
  TEST_EXPECT_EQ(out, 7u);
}

void test_empty_input() {
  std::uint8_t out = 0;
  TEST_EXPECT_ERROR(bitwire::decode(bytes_view{}, out), errc::unexpected_end);

  std::string text = "x";
  TEST_EXPECT_ERROR(bitwire::decode(bytes_view{}, text), errc::unexpected_end);
  TEST_EXPECT_EQ(text, "x");
}

void test_truncated_snapshot() {
  const auto bytes = bitwire::encode(sample_snapshot());
  for (std::size_t n = 0; n < bytes.size(); ++n) {
    Snapshot out;
    TEST_EXPECT_ERROR(bitwire::decode(bytes_view{bytes.data(), n}, out), errc::unexpected_end);
  }
}

void test_encode_options() {
  bitwire::EncodeOptions options;
  options.initial_capacity = 1;
  TEST_EXPECT_EQ(bitwire::encode(sample_snapshot(), options), bitwire::encode(sample_snapshot()));
}

void test_reusable_buffer() {
  bitwire::Buffer buffer(4);

  const auto first = buffer.encode(sample_snapshot());
  const std::vector<byte> first_copy(first.begin(), first.end());
  TEST_EXPECT_EQ(first_copy, bitwire::encode(sample_snapshot()));

  // 第二次编码更短：不能残留上一条消息的字节或补齐位。
  const auto second = buffer.encode(Header{2, true, true});
  TEST_EXPECT_EQ(std::vector<byte>(second.begin(), second.end()), bitwire::encode(Header{2, true, true}));

  Snapshot decoded;
  TEST_EXPECT_OK(buffer.decode(first_copy, decoded));
  TEST_EXPECT(decoded == sample_snapshot());
  TEST_EXPECT_ERROR(buffer.decode(bytes_view{first_copy.data(), 3}, decoded), errc::unexpected_end);
  TEST_EXPECT(decoded == sample_snapshot());
}

void test_buffer_decodes_its_own_view() {
  bitwire::Buffer buffer;
  const auto view = buffer.encode(std::string("self"));
  std::string out;
  TEST_EXPECT_OK(buffer.decode(view, out));
  TEST_EXPECT_EQ(out, "self");
}

}  // namespace

int main() {
  test_signed_minus_one_scenario();
  test_byte_sequence_scenario();
  test_snapshot_roundtrip();
  test_padding_is_not_trailing_data();
  test_trailing_bytes();
  test_empty_input();
  test_truncated_snapshot();
  test_encode_options();
  test_reusable_buffer();
  test_buffer_decodes_its_own_view();
  return ::bitwire::tests::run_and_report();
}
