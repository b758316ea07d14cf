#include "bitwire/codec/utf8.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace {

using bitwire::byte;
using bitwire::bytes_view;
using bitwire::errc;
namespace codec = bitwire::codec;

bytes_view as_bytes(std::string_view s) {
  return bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()};
}

void expect_invalid_at(std::vector<byte> input, std::size_t offset) {
  std::size_t at = 12345;
  auto ec = codec::validate_utf8(input, at);
  TEST_EXPECT_ERROR(ec, errc::invalid_utf8);
  TEST_EXPECT_EQ(at, offset);
  TEST_EXPECT(!codec::is_valid_utf8(input));
}

void test_valid_inputs() {
  std::size_t at = 777;
  TEST_EXPECT_OK(codec::validate_utf8(bytes_view{}, at));
  TEST_EXPECT_EQ(at, 777u);

  TEST_EXPECT(codec::is_valid_utf8(as_bytes("plain ascii text, longer than eight bytes")));
  TEST_EXPECT(codec::is_valid_utf8(as_bytes("caf\xC3\xA9")));               // U+00E9
  TEST_EXPECT(codec::is_valid_utf8(as_bytes("\xE2\x82\xAC")));              // U+20AC
  TEST_EXPECT(codec::is_valid_utf8(as_bytes("\xF0\x9F\x98\x80 smile")));    // U+1F600
  TEST_EXPECT(codec::is_valid_utf8(as_bytes("\xF4\x8F\xBF\xBF")));          // U+10FFFF
  TEST_EXPECT(codec::is_valid_utf8(as_bytes("\xED\x9F\xBF")));              // U+D7FF
  TEST_EXPECT(codec::is_valid_utf8(as_bytes(std::string_view("a\0b", 3))));
}

void test_invalid_lead_bytes() {
  expect_invalid_at({0x80}, 0);
  expect_invalid_at({'a', 'b', 0xBF}, 2);
  expect_invalid_at({0xC0, 0x80}, 0);
  expect_invalid_at({0xC1, 0xBF}, 0);
  expect_invalid_at({0xF5, 0x80, 0x80, 0x80}, 0);
  expect_invalid_at({0xFF}, 0);
}

void test_overlong_and_surrogates() {
  expect_invalid_at({0xE0, 0x80, 0xAF}, 0);        // 过长的 '/'
  expect_invalid_at({0xF0, 0x80, 0x80, 0xAF}, 0);  // 过长的 '/'
  expect_invalid_at({0xED, 0xA0, 0x80}, 0);        // U+D800
  expect_invalid_at({0xED, 0xBF, 0xBF}, 0);        // U+DFFF
  expect_invalid_at({0xF4, 0x90, 0x80, 0x80}, 0);  // U+110000
}

void test_truncated_sequences() {
  expect_invalid_at({'o', 'k', 0xC3}, 2);
  expect_invalid_at({0xE2, 0x82}, 0);
  expect_invalid_at({0xF0, 0x9F, 0x98}, 0);
  expect_invalid_at({0xE2, 0x28, 0xA1}, 0);
}

void test_offset_after_ascii_fast_path() {
  std::vector<byte> input(20, 'x');
  input.push_back(0xC3);
  input.push_back(0x28);
  expect_invalid_at(input, 20);
}

}  // namespace

int main() {
  test_valid_inputs();
  test_invalid_lead_bytes();
  test_overlong_and_surrogates();
  test_truncated_sequences();
  test_offset_after_ascii_fast_path();
  return ::bitwire::tests::run_and_report();
}
