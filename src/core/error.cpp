#include "arev/core/error.hpp"

#include <string>
#include <system_error>

namespace arev::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志）
class arev_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "arev.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::timeout:
        return "timeout";
      case errc::cancelled:
        return "cancelled";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::callback_failure:
        return "callback failure";
      case errc::broken_promise:
        return "broken promise";
      default:
        return "unknown arev.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static arev_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::string describe_exception(const std::exception_ptr& ex) {
  if (!ex) {
    return "no exception";
  }
  try {
    std::rethrow_exception(ex);
  } catch (const std::system_error& e) {
    return std::string{"system_error ["} + e.code().category().name() + "] " + e.what();
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    // 非 std::exception 派生的异常只能给出占位描述。
    return "unknown exception";
  }
}

}  // 命名空间 arev::core
