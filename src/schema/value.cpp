#include "bitwire/schema/value.hpp"

#include <bit>
#include <type_traits>
#include <utility>

namespace bitwire::schema {
namespace {

// 浮点按位模式比较：NaN 与自身相等，+0 与 -0 不等，和线格式的视角一致。
bool float_bits_equal(float a, float b) noexcept {
  return std::bit_cast<std::uint32_t>(a) == std::bit_cast<std::uint32_t>(b);
}

bool double_bits_equal(double a, double b) noexcept {
  return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

bool inner_equal(const std::shared_ptr<const Value>& lhs, const std::shared_ptr<const Value>& rhs) noexcept {
  if (!lhs || !rhs) {
    return !lhs && !rhs;
  }
  return *lhs == *rhs;
}

}  // namespace

Value::Value(Bool v) : storage_(v) {}
Value::Value(Unsigned v) : storage_(v) {}
Value::Value(Signed v) : storage_(v) {}
Value::Value(F32 v) : storage_(v) {}
Value::Value(F64 v) : storage_(v) {}
Value::Value(Text v) : storage_(std::move(v)) {}
Value::Value(Bytes v) : storage_(std::move(v)) {}
Value::Value(List v) : storage_(std::move(v)) {}
Value::Value(Optional v) : storage_(std::move(v)) {}
Value::Value(Tagged v) : storage_(std::move(v)) {}

Value Value::boolean(bool value) {
  return Value(Bool{value});
}

Value Value::u(std::uint64_t value) {
  return Value(Unsigned{value});
}

Value Value::i(std::int64_t value) {
  return Value(Signed{value});
}

Value Value::f32(float value) {
  return Value(F32{value});
}

Value Value::f64(double value) {
  return Value(F64{value});
}

Value Value::string(std::string value) {
  return Value(Text{std::move(value)});
}

Value Value::bytes(std::vector<byte> value) {
  return Value(Bytes{std::move(value)});
}

Value Value::list(std::vector<Value> values) {
  return Value(std::move(values));
}

Value Value::none() {
  return Value(Optional{});
}

Value Value::some(Value value) {
  return Value(Optional{std::make_shared<const Value>(std::move(value))});
}

Value Value::tagged(std::size_t index, Value value) {
  return Value(Tagged{index, std::make_shared<const Value>(std::move(value))});
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  return std::visit(
    [&](const auto& a) -> bool {
      using T = std::decay_t<decltype(a)>;
      const auto* b = std::get_if<T>(&rhs.storage_);
      if (!b) {
        return false;
      }
      if constexpr (std::is_same_v<T, F32>) {
        return float_bits_equal(a.value, b->value);
      } else if constexpr (std::is_same_v<T, F64>) {
        return double_bits_equal(a.value, b->value);
      } else if constexpr (std::is_same_v<T, Optional>) {
        return inner_equal(a.value, b->value);
      } else if constexpr (std::is_same_v<T, Tagged>) {
        return a.index == b->index && inner_equal(a.value, b->value);
      } else {
        return a == *b;
      }
    },
    lhs.storage_);
}

}  // namespace bitwire::schema
