#include "arev/core/error.hpp"

#include "test_main.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using arev::core::describe_exception;
using arev::core::errc;
using arev::core::make_error_code;

void test_error_category_and_messages() {
  auto ec = make_error_code(errc::timeout);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "arev.core");
  TEST_EXPECT(!ec.message().empty());
  TEST_EXPECT(ec);
  TEST_EXPECT(!make_error_code(errc::ok));

  // is_error_code_enum 特化：可以直接与枚举比较。
  TEST_EXPECT(ec == errc::timeout);
  TEST_EXPECT(ec != errc::cancelled);
}

void test_all_error_codes() {
  TEST_EXPECT_EQ(make_error_code(errc::ok).message(), "ok");
  TEST_EXPECT_EQ(make_error_code(errc::timeout).message(), "timeout");
  TEST_EXPECT_EQ(make_error_code(errc::cancelled).message(), "cancelled");
  TEST_EXPECT_EQ(make_error_code(errc::invalid_argument).message(), "invalid argument");
  TEST_EXPECT_EQ(make_error_code(errc::callback_failure).message(), "callback failure");
  TEST_EXPECT_EQ(make_error_code(errc::broken_promise).message(), "broken promise");
}

void test_unknown_error_code() {
  std::error_code ec(9999, arev::core::error_category());
  TEST_EXPECT_EQ(ec.message(), "unknown arev.core error");
}

void test_describe_exception() {
  TEST_EXPECT_EQ(describe_exception(nullptr), "no exception");

  auto runtime = std::make_exception_ptr(std::runtime_error("boom"));
  TEST_EXPECT_EQ(describe_exception(runtime), "boom");

  auto system = std::make_exception_ptr(std::system_error(make_error_code(errc::cancelled)));
  auto text = describe_exception(system);
  TEST_EXPECT(text.find("arev.core") != std::string::npos);
  TEST_EXPECT(text.find("cancelled") != std::string::npos);

  auto odd = std::make_exception_ptr(42);
  TEST_EXPECT_EQ(describe_exception(odd), "unknown exception");
}

}  // namespace

int main() {
  test_error_category_and_messages();
  test_all_error_codes();
  test_unknown_error_code();
  test_describe_exception();
  return ::arev::tests::run_and_report();
}
