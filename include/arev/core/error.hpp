#pragma once

#include <exception>
#include <string>
#include <system_error>

namespace arev::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有公开接口优先返回 std::error_code（或携带 error_code 的 Future），避免异常路径。
 * - timeout/cancelled 用于描述“等待类 API”的典型结果：
 *   - timeout：超过指定等待时间（事件 wait 以 false 表示，DelegatePump::send 以 timeout 表示）
 *   - cancelled：std::stop_token 被触发
 * - callback_failure：用户回调抛出异常，异常本体可通过 Future::exception() 取得
 * - broken_promise：Promise 在完成前被销毁
 */
enum class errc : int {
  ok = 0,
  timeout = 1,
  cancelled = 2,
  invalid_argument = 3,
  callback_failure = 4,
  broken_promise = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 把异常渲染为可读文本（仅用于日志）。
[[nodiscard]] std::string describe_exception(const std::exception_ptr& ex);

}  // namespace arev::core

namespace std {
template <>
struct is_error_code_enum<arev::core::errc> : true_type {};
}  // namespace std
