#pragma once

#include "arev/core/common.hpp"
#include "arev/core/future.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <utility>

namespace arev::event {

/**
 * @brief 自动复位事件：每次 set() 只放行一个等待者（严格 FIFO）。
 *
 * 不变量：signaled_ 为 true 时 waiters_ 必为空，反之亦然。
 *
 * 超时/取消的等待者不会从队列中间移除：它留在原位，之后轮到它时收到的放行
 * 会被转发给下一次 set()，因此信号不会丢失。
 *
 * 状态放在 shared_ptr 中，转发续体只持有 weak_ptr：事件先于执行器上排队的完成动作销毁也是安全的。
 */
class AutoResetEvent final {
 public:
  using executor_type = asio::any_io_executor;

  explicit AutoResetEvent(executor_type ex);
  ~AutoResetEvent();

  AutoResetEvent(const AutoResetEvent&) = delete;
  AutoResetEvent& operator=(const AutoResetEvent&) = delete;

  /**
   * @brief 等待一次放行。
   *
   * 结果：true 被放行；false 超时（或 timeout == 0 且未置位）；错误码 cancelled / invalid_argument。
   */
  [[nodiscard]] core::Future<bool> wait(std::stop_token token = {});
  [[nodiscard]] core::Future<bool> wait(core::duration timeout, std::stop_token token = {});

  /**
   * @brief 放行最早的等待者；没有等待者时置位。
   *
   * 出队/置位总是同步完成；run_inline == false 时只把等待者的完成动作 post 到执行器。
   * 另一线程正在执行放行循环时，本次放行交给该循环完成。
   */
  void set(bool run_inline = true);

  [[nodiscard]] bool is_set() const;
  [[nodiscard]] std::size_t waiter_count() const;

  asio::awaitable<std::error_code> async_wait(core::duration timeout = core::kInfinite, std::stop_token token = {});

  [[nodiscard]] executor_type get_executor() const noexcept { return state_->ex; }

 private:
  struct State {
    explicit State(executor_type e) : ex(std::move(e)) {}

    executor_type ex;
    std::mutex mu{};
    bool signaled{false};
    std::deque<core::Promise<bool>> waiters{};

    // 放行循环：同一时刻只有一个线程出队，其他 set()（包括转发）只登记次数。
    bool releasing{false};
    std::size_t pending_inline{0};
    std::size_t pending_posted{0};
  };

  static void release_(const std::shared_ptr<State>& state, bool run_inline);
  static void forward_release_(std::weak_ptr<State> state, const core::Future<bool>& result, core::Future<bool> waiter);

  std::shared_ptr<State> state_;
};

}  // namespace arev::event
