#pragma once

#include "arev/core/common.hpp"
#include "arev/core/future.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <atomic>
#include <memory>
#include <stop_token>
#include <system_error>

namespace arev::event {

/**
 * @brief 手动复位事件（广播闩锁）。
 *
 * 状态是“当前代”（generation）：一个 Promise<bool>。
 * - set()：完成当前代，所有已挂起与之后的等待都观察到 true，直到 reset()
 * - reset()：用新的未完成代替换已完成的代（CAS 重试）；当前代未完成时为空操作
 *
 * 线程安全：所有成员函数可并发调用；并发 reset 不会产生两个未完成的代。
 */
class ManualResetEvent final {
 public:
  using executor_type = asio::any_io_executor;

  explicit ManualResetEvent(executor_type ex, bool signaled = false);

  ManualResetEvent(const ManualResetEvent&) = delete;
  ManualResetEvent& operator=(const ManualResetEvent&) = delete;

  /**
   * @brief 等待事件被置位。
   *
   * 结果：true 已置位；false 超时；错误码 cancelled / invalid_argument。
   * - timeout == 0：不阻塞，仅检查当前状态
   * - 无超时且 token 不可停止：直接返回当前代的 Future
   */
  [[nodiscard]] core::Future<bool> wait(std::stop_token token = {});
  [[nodiscard]] core::Future<bool> wait(core::duration timeout, std::stop_token token = {});

  /**
   * @brief 置位（幂等）。
   *
   * run_inline == false 时在调用时刻捕获当前代，把完成动作（及其全部续体）post 到执行器，
   * 因此 post 执行前 is_set() 仍可能返回 false。
   */
  void set(bool run_inline = true);
  void reset();

  [[nodiscard]] bool is_set() const noexcept;

  // 协程便捷接口：{} 已置位，errc::timeout 超时，其余为对应错误码。
  asio::awaitable<std::error_code> async_wait(core::duration timeout = core::kInfinite, std::stop_token token = {});

  [[nodiscard]] executor_type get_executor() const noexcept { return ex_; }

 private:
  executor_type ex_;
  std::atomic<std::shared_ptr<core::Promise<bool>>> generation_;
};

}  // namespace arev::event
