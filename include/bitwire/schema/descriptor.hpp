#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bitwire::schema {

/**
 * @brief 运行期 schema 节点的种类。
 *
 * 与编译期 Codec<T> 一一对应：
 * - u8..u64：定长（Codec<std::uint*_t>）；
 * - i8..i64：zigzag + 变长（Codec<std::int*_t>）；
 * - string / bytes：长度前缀 + 字节（Codec<std::string> / Codec<std::vector<std::uint8_t>>）；
 * - sequence：长度前缀 + 元素（Codec<std::vector<T>>）；
 * - optional：1 位存在标记（Codec<std::optional<T>>）；
 * - structure：字段按顺序紧排（BITWIRE_FIELDS / std::tuple）；
 * - variant：判别值 + 变体内容（Codec<std::variant<...>>）。
 */
enum class Kind : std::uint8_t {
  boolean,
  u8,
  u16,
  u32,
  u64,
  i8,
  i16,
  i32,
  i64,
  f32,
  f64,
  string,
  bytes,
  sequence,
  optional,
  structure,
  variant,
};

[[nodiscard]] std::string_view kind_name(Kind kind) noexcept;

class Descriptor;
using DescriptorPtr = std::shared_ptr<const Descriptor>;

// structure 的字段 / variant 的备选项（name 仅用于调试输出，不进入线格式）。
struct Field final {
  std::string name;
  DescriptorPtr type;
};

/**
 * @brief 不可变的运行期 schema 描述。
 *
 * 只能通过工厂函数创建；子节点以 shared_ptr<const> 共享，同一个描述可被多处引用。
 * 子节点为空指针时不在构造期报错，而是在编解码时返回 errc::invalid_argument。
 */
class Descriptor final {
 public:
  static DescriptorPtr boolean();
  static DescriptorPtr u8();
  static DescriptorPtr u16();
  static DescriptorPtr u32();
  static DescriptorPtr u64();
  static DescriptorPtr i8();
  static DescriptorPtr i16();
  static DescriptorPtr i32();
  static DescriptorPtr i64();
  static DescriptorPtr f32();
  static DescriptorPtr f64();
  static DescriptorPtr string();
  static DescriptorPtr bytes();

  static DescriptorPtr sequence(DescriptorPtr element);
  static DescriptorPtr optional(DescriptorPtr inner);
  static DescriptorPtr structure(std::vector<Field> fields);
  static DescriptorPtr variant(std::vector<Field> alternatives);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

  // structure 的字段或 variant 的备选项；其它种类为空。
  [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }

  // sequence 的元素类型或 optional 的内部类型；其它种类为空指针。
  [[nodiscard]] const DescriptorPtr& element() const noexcept { return element_; }

  // variant 判别值位数（bits_for_count(备选项个数)）。
  [[nodiscard]] unsigned tag_bits() const noexcept;

  [[nodiscard]] bool is_unsigned_integer() const noexcept;
  [[nodiscard]] bool is_signed_integer() const noexcept;

  // 整数种类的位宽（8/16/32/64），非整数返回 0。
  [[nodiscard]] unsigned integer_bits() const noexcept;

  // 任意合法编码至少占用的位数（与 Codec<T>::min_bits 一致）。
  [[nodiscard]] std::size_t min_bits() const noexcept;

 private:
  Descriptor(Kind kind, DescriptorPtr element, std::vector<Field> fields);
  static DescriptorPtr make_(Kind kind, DescriptorPtr element, std::vector<Field> fields);

  Kind kind_;
  DescriptorPtr element_;
  std::vector<Field> fields_;
};

}  // namespace bitwire::schema
