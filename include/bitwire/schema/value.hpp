#pragma once

#include "bitwire/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace bitwire::schema {

class Value;
using List = std::vector<Value>;

struct Bool final {
  bool value{};
  friend bool operator==(const Bool&, const Bool&) = default;
};

struct Unsigned final {
  std::uint64_t value{};
  friend bool operator==(const Unsigned&, const Unsigned&) = default;
};

struct Signed final {
  std::int64_t value{};
  friend bool operator==(const Signed&, const Signed&) = default;
};

// 浮点按位比较（见 value.cpp），因此不使用默认的 operator==。
struct F32 final {
  float value{};
};

struct F64 final {
  double value{};
};

struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

struct Bytes final {
  std::vector<byte> value;
  friend bool operator==(const Bytes&, const Bytes&) = default;
};

// value 为空指针表示“不存在”。
struct Optional final {
  std::shared_ptr<const Value> value;
};

// variant 的取值：备选项下标 + 该备选项的内容。
struct Tagged final {
  std::size_t index{};
  std::shared_ptr<const Value> value;
};

/**
 * @brief 运行期 schema 对应的动态值（可嵌套）。
 *
 * 与 Descriptor 的对应关系：
 * - boolean -> Bool；u8..u64 -> Unsigned；i8..i64 -> Signed；f32 -> F32；f64 -> F64；
 * - string -> Text；bytes -> Bytes；
 * - sequence 与 structure -> List（structure 的元素按字段顺序排列）；
 * - optional -> Optional；variant -> Tagged。
 *
 * Optional/Tagged 的内部值不可变，复制 Value 时共享。
 */
class Value final {
 public:
  using storage_type = std::variant<Bool, Unsigned, Signed, F32, F64, Text, Bytes, List, Optional, Tagged>;

  Value() = delete;

  explicit Value(Bool v);
  explicit Value(Unsigned v);
  explicit Value(Signed v);
  explicit Value(F32 v);
  explicit Value(F64 v);
  explicit Value(Text v);
  explicit Value(Bytes v);
  explicit Value(List v);
  explicit Value(Optional v);
  explicit Value(Tagged v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<List>(storage_); }

  static Value boolean(bool value);
  static Value u(std::uint64_t value);
  static Value i(std::int64_t value);
  static Value f32(float value);
  static Value f64(double value);
  static Value string(std::string value);
  static Value bytes(std::vector<byte> value);
  static Value list(std::vector<Value> values);
  static Value none();
  static Value some(Value value);
  static Value tagged(std::size_t index, Value value);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

}  // namespace bitwire::schema
