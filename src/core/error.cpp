#include "bitwire/core/error.hpp"

#include <string>

namespace bitwire::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志；不参与线格式）
class bitwire_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bitwire"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unexpected_end:
        return "unexpected end of input";
      case errc::malformed_varint:
        return "malformed varint";
      case errc::invalid_utf8:
        return "invalid utf-8";
      case errc::invalid_variant:
        return "invalid variant discriminant";
      case errc::out_of_range:
        return "value out of range";
      case errc::length_overflow:
        return "length overflow";
      case errc::trailing_data:
        return "trailing data after value";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::schema_mismatch:
        return "value does not match schema";
      case errc::depth_exceeded:
        return "maximum nesting depth exceeded";
      default:
        return "unknown bitwire error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static bitwire_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 bitwire::core
