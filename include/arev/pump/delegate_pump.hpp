#pragma once

#include "arev/core/common.hpp"
#include "arev/core/context.hpp"
#include "arev/core/future.hpp"
#include "arev/pump/message_pump.hpp"
#include "arev/pump/work_unit.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <cstddef>
#include <memory>
#include <stop_token>
#include <system_error>
#include <type_traits>
#include <utility>

namespace arev::pump {

namespace detail {

template <typename A>
struct awaitable_result;

template <typename R, typename Executor>
struct awaitable_result<asio::awaitable<R, Executor>> {
  using type = R;
};

}  // namespace detail

/**
 * @brief 顺序执行可调用单元的泵（基于 MessagePump<std::shared_ptr<WorkUnit>>）。
 *
 * - post(action)：即发即忘，失败交给 PumpOptions::on_error
 * - send(action, timeout, token)：返回 Future<R>；单元在被泵执行之前可以超时或被取消，
 *   此时 action 不会运行，结果为 errc::timeout / errc::cancelled；一旦开始执行，
 *   之后的超时/取消不再影响它
 *
 * 执行顺序严格等于提交顺序；被跳过的单元保留其位置。
 *
 * 提交者的 core::Context::current() 在 post/send 时被捕获（PumpOptions::flow_context 为 false 时为空）：
 * - action 接受 core::Context 参数时直接收到该快照
 * - 调用 action 取得 awaitable 的同步过程中，该快照被安装为环境上下文
 */
class DelegatePump final {
 public:
  using executor_type = asio::any_io_executor;

  explicit DelegatePump(executor_type ex, PumpOptions options = {});

  DelegatePump(const DelegatePump&) = delete;
  DelegatePump& operator=(const DelegatePump&) = delete;

  void post(Action action);
  void post(ContextAction action);

  /**
   * @brief 提交带结果的单元。
   *
   * 入队前同步失败（返回已完成的 Future，不入队）：
   * - timeout 为 0 或非法负值 -> errc::invalid_argument
   * - token 已触发 -> errc::cancelled
   */
  template <typename Fn>
  auto send(Fn&& action, core::duration timeout = core::kInfinite, std::stop_token token = {}) {
    auto bound = with_context_(std::forward<Fn>(action));
    using R = typename detail::awaitable_result<std::invoke_result_t<decltype(bound)&, core::Context>>::type;
    if (auto ec = validate_send_(timeout, token)) {
      return core::make_error_future<R>(ec);
    }
    auto unit = std::make_shared<SendUnit<R>>(pump_.executor(), typename SendUnit<R>::Fn(std::move(bound)));
    auto result = unit->get_future();
    unit->arm(timeout, std::move(token));
    pump_.post(std::shared_ptr<WorkUnit>(std::move(unit)));
    return result;
  }

  [[nodiscard]] std::size_t count() const { return pump_.count(); }
  [[nodiscard]] core::Future<void> drain() { return pump_.drain(); }
  [[nodiscard]] executor_type executor() const noexcept { return pump_.executor(); }

 private:
  // action 可以不接受上下文参数，此时包一层忽略它。
  template <typename Fn>
  static auto with_context_(Fn&& fn) {
    if constexpr (std::is_invocable_v<std::decay_t<Fn>&, core::Context>) {
      return std::decay_t<Fn>(std::forward<Fn>(fn));
    } else {
      return [fn = std::forward<Fn>(fn)](core::Context) mutable { return fn(); };
    }
  }

  static std::error_code validate_send_(core::duration timeout, const std::stop_token& token);

  MessagePump<std::shared_ptr<WorkUnit>> pump_;
};

}  // namespace arev::pump
