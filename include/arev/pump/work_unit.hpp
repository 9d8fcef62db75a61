#pragma once

#include "arev/core/common.hpp"
#include "arev/core/context.hpp"
#include "arev/core/error.hpp"
#include "arev/core/future.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <type_traits>
#include <utility>

namespace arev::pump {

using Action = std::function<asio::awaitable<void>()>;
using ContextAction = std::function<asio::awaitable<void>(core::Context)>;

namespace detail {

// 以 ctx 为环境上下文调用 fn 取得 awaitable；协程体要到 co_await 时才执行，应使用参数中的 ctx。
template <typename Fn>
auto start_in_context(Fn& fn, const core::Context& ctx) {
  core::Context::Scope scope(ctx);
  return fn(ctx);
}

}  // namespace detail

/**
 * @brief DelegatePump 队列中的可调度单元。
 *
 * execute 的参数是提交者在 post/send 时的 core::Context。
 */
class WorkUnit {
 public:
  virtual ~WorkUnit() = default;

  virtual asio::awaitable<void> execute(core::Context ctx) = 0;
};

/**
 * @brief post 提交的单元：没有期限与取消，异常交给泵的错误处理器。
 */
class ActionUnit final : public WorkUnit {
 public:
  explicit ActionUnit(ContextAction action) : action_(std::move(action)) {}

  asio::awaitable<void> execute(core::Context ctx) override;

 private:
  ContextAction action_;
};

enum class UnitState : std::uint8_t {
  pending = 0,
  started = 1,
  terminal = 2,
};

/**
 * @brief 带期限与取消信号的单元（send 使用）。
 *
 * 状态机：pending -> started（泵先到达）或 pending -> terminal（超时/取消先到达），
 * 迁移是一次 CAS，只有成功迁移的一方可以执行或收尾。
 *
 * - 泵先到达：释放定时器与取消注册，然后执行 run_()；之后的超时/取消不再影响它
 * - 超时/取消先到达：以 errc::timeout / errc::cancelled 调用 expire_()，泵到达时直接跳过
 *
 * 定时器绑定在单元私有的 strand 上；arm() 必须在单元被 shared_ptr 管理之后、入队之前调用。
 */
class GuardedUnit : public WorkUnit, public std::enable_shared_from_this<GuardedUnit> {
 public:
  explicit GuardedUnit(const asio::any_io_executor& ex);

  void arm(core::duration timeout, std::stop_token token);

  asio::awaitable<void> execute(core::Context ctx) final;

  [[nodiscard]] UnitState state() const noexcept { return state_.load(std::memory_order_acquire); }

 protected:
  virtual asio::awaitable<void> run_(core::Context ctx) = 0;
  virtual void expire_(std::error_code reason) = 0;

 private:
  struct StopHandler {
    GuardedUnit* unit;

    void operator()() const noexcept;
  };

  using Registration = std::stop_callback<StopHandler>;

  bool claim_(UnitState to) noexcept;
  void on_timeout_();
  void on_stop_();
  void cancel_timer_();
  void release_registration_();

  std::atomic<UnitState> state_{UnitState::pending};
  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer timer_;
  bool has_timer_{false};
  std::mutex mu_{};
  bool released_{false};
  std::unique_ptr<Registration> registration_{};
};

// action 以取消结束：errc::cancelled 或 asio::error::operation_aborted。
[[nodiscard]] bool is_cancellation(const std::error_code& ec) noexcept;

/**
 * @brief send 提交的单元：执行 action 并把结果写入调用方的 Future<R>。
 *
 * - 正常返回 -> 值
 * - std::system_error 且为取消 -> errc::cancelled
 * - 其他异常 -> errc::callback_failure（异常本体可由 Future::exception() 取得）
 */
template <typename R>
class SendUnit final : public GuardedUnit {
 public:
  using Fn = std::function<asio::awaitable<R>(core::Context)>;

  SendUnit(const asio::any_io_executor& ex, Fn fn) : GuardedUnit(ex), fn_(std::move(fn)) {}

  [[nodiscard]] core::Future<R> get_future() const { return result_.get_future(); }

 protected:
  asio::awaitable<void> run_(core::Context ctx) override {
    try {
      if constexpr (std::is_void_v<R>) {
        co_await detail::start_in_context(fn_, ctx);
        result_.try_set_value();
      } else {
        result_.try_set_value(co_await detail::start_in_context(fn_, ctx));
      }
    } catch (const std::system_error& e) {
      if (is_cancellation(e.code())) {
        result_.try_set_error(core::make_error_code(core::errc::cancelled));
      } else {
        result_.try_set_exception(std::current_exception());
      }
    } catch (...) {
      result_.try_set_exception(std::current_exception());
    }
  }

  void expire_(std::error_code reason) override { result_.try_set_error(reason); }

 private:
  Fn fn_;
  core::Promise<R> result_{};
};

}  // namespace arev::pump
