#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace bitwire::tests {

// 每个测试可执行文件内的断言统计。
struct Counters final {
  int checks{0};
  int failures{0};
};

inline Counters& counters() {
  static Counters c;
  return c;
}

inline void record_failure(const char* file, int line, std::string_view message) {
  ++counters().failures;
  std::cerr << file << ":" << line << ": " << message << "\n";
}

inline std::string describe(const std::error_code& ec) {
  std::ostringstream oss;
  oss << ec.category().name() << ":" << ec.value() << " (" << ec.message() << ")";
  return oss.str();
}

inline void expect_true(bool value, const char* expr, const char* file, int line) {
  ++counters().checks;
  if (!value) {
    record_failure(file, line, std::string("expected true: ") + expr);
  }
}

template <class L, class R>
inline void expect_eq(const L& lhs,
                      const R& rhs,
                      const char* lhs_expr,
                      const char* rhs_expr,
                      const char* file,
                      int line) {
  ++counters().checks;
  if (!(lhs == rhs)) {
    record_failure(file, line, std::string("expected equal: ") + lhs_expr + " == " + rhs_expr);
  }
}

inline void expect_ok(const std::error_code& ec, const char* expr, const char* file, int line) {
  ++counters().checks;
  if (ec) {
    record_failure(file, line, std::string("expected success: ") + expr + " returned " + describe(ec));
  }
}

// 期望得到指定错误码；同时打印实际结果，便于定位解码在哪一步出错。
inline void expect_error(const std::error_code& ec,
                         const std::error_code& expected,
                         const char* expr,
                         const char* file,
                         int line) {
  ++counters().checks;
  if (ec != expected) {
    record_failure(file, line,
                   std::string("expected ") + describe(expected) + ": " + expr + " returned " +
                     (ec ? describe(ec) : std::string("success")));
  }
}

inline int run_and_report() {
  const auto& c = counters();
  if (c.failures == 0) {
    std::cout << "ok: " << c.checks << " checks\n";
    return 0;
  }
  std::cerr << "FAILED: " << c.failures << " of " << c.checks << " checks\n";
  return 1;
}

}  // namespace bitwire::tests

#define TEST_EXPECT(expr) ::bitwire::tests::expect_true((expr), #expr, __FILE__, __LINE__)
#define TEST_EXPECT_EQ(a, b) ::bitwire::tests::expect_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define TEST_EXPECT_OK(ec) ::bitwire::tests::expect_ok((ec), #ec, __FILE__, __LINE__)
#define TEST_EXPECT_ERROR(ec, e) \
  ::bitwire::tests::expect_error((ec), ::bitwire::make_error_code(e), #ec, __FILE__, __LINE__)
#define TEST_FAIL(msg) ::bitwire::tests::record_failure(__FILE__, __LINE__, (msg))
