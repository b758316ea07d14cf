#pragma once

#include "bitwire/schema/codec.hpp"

#include <system_error>

namespace bitwire::schema {

/**
 * @brief 按声明顺序编码一组字段（字段之间不留任何填充位）。
 */
template <class... Fields>
void encode_fields(BitBuffer& buf, const Fields&... fields) {
  (Codec<Fields>::encode(buf, fields), ...);
}

/**
 * @brief 按同样顺序解码一组字段，返回遇到的第一个错误，其后的字段不再读取。
 *
 * 注意：失败时前面的字段可能已被写入；Codec<T>（T 满足 Schema）会先解码到临时对象，
 * 因此通过 Codec / bitwire::decode 调用时不会暴露半成品。
 */
template <class... Fields>
std::error_code decode_fields(BitBuffer& buf, Fields&... fields) {
  std::error_code ec;
  ((ec = Codec<Fields>::decode(buf, fields), !ec) && ...);
  return ec;
}

}  // namespace bitwire::schema

/**
 * @brief 为 struct/class 生成满足 schema::Schema 的 encode/decode 成员。
 *
 * 字段列表即 schema：顺序决定线格式，增删/调换字段都会使新旧两端互不兼容。
 * 字段列表可以为空（不占任何位的消息，例如 tagged union 中的无数据变体）。
 *
 * 使用示例：
 * @code
 * struct PlayerState {
 *   std::uint32_t id{};
 *   std::int32_t x{};
 *   std::optional<std::string> name;
 *   BITWIRE_FIELDS(id, x, name)
 * };
 * @endcode
 */
#define BITWIRE_FIELDS(...)                                                       \
  void encode(::bitwire::BitBuffer& bitwire_buf_) const {                         \
    ::bitwire::schema::encode_fields(bitwire_buf_ __VA_OPT__(, ) __VA_ARGS__);    \
  }                                                                               \
  std::error_code decode(::bitwire::BitBuffer& bitwire_buf_) {                    \
    return ::bitwire::schema::decode_fields(bitwire_buf_ __VA_OPT__(, ) __VA_ARGS__); \
  }
