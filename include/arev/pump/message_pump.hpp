#pragma once

#include "arev/core/context.hpp"
#include "arev/core/future.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace arev::pump {

using ErrorHandler = std::function<asio::awaitable<void>(std::exception_ptr)>;

/**
 * @brief 泵的可选配置。
 *
 * - on_error：处理单个条目失败（等待投递值失败或回调抛异常）；为空时只记录日志
 * - flow_context：post 时是否捕获发布者的 core::Context::current()
 */
struct PumpOptions {
  ErrorHandler on_error{};
  bool flow_context{true};
};

namespace detail {

void log_unhandled_failure(const std::exception_ptr& failure);
void log_handler_failure(const std::exception_ptr& failure);

}  // namespace detail

/**
 * @brief 有序的单消费者执行器。
 *
 * - 可并发 post 值或待完成结果（Future<T>）；
 * - 按 post 顺序逐个处理，回调之间不重叠；
 * - 单个条目失败不会中断队列，处理循环只在队列为空时结束。
 *
 * 回调可以是以下任意形式：
 * - void(T) / void(T, core::Context)：同步回调，执行期间安装条目捕获的上下文
 * - asio::awaitable<void>(T) / asio::awaitable<void>(T, core::Context)：协程回调；
 *   上下文只在调用回调取得 awaitable 的同步过程中安装，协程体内请使用参数中的 Context
 *
 * 状态放在 shared_ptr 中，处理循环持有一份引用：泵对象先于循环销毁也是安全的。
 */
template <typename T>
class MessagePump final {
 public:
  using value_type = T;
  using executor_type = asio::any_io_executor;
  using Callback = std::function<asio::awaitable<void>(T, core::Context)>;

  template <typename Fn>
  MessagePump(executor_type ex, Fn&& callback, PumpOptions options = {})
    : state_(std::make_shared<State>(std::move(ex), adapt_(std::forward<Fn>(callback)), std::move(options))) {}

  MessagePump(const MessagePump&) = delete;
  MessagePump& operator=(const MessagePump&) = delete;

  void post(T value) { post_(Item{std::in_place_index<0>, std::move(value)}); }
  void post(core::Future<T> pending) { post_(Item{std::in_place_index<1>, std::move(pending)}); }

  /**
   * @brief 队列中的条目数（包括正在处理的队首）。
   */
  [[nodiscard]] std::size_t count() const {
    std::lock_guard lk(state_->mu);
    return state_->queue.size();
  }

  /**
   * @brief 等待队列变空。
   *
   * 队列为空时返回共享的已完成常量；否则返回惰性创建的同一个句柄，
   * 在队列转为空时完成。
   */
  [[nodiscard]] core::Future<void> drain() {
    std::lock_guard lk(state_->mu);
    if (state_->queue.empty()) {
      return core::completed_future();
    }
    if (!state_->drain) {
      state_->drain.emplace();
    }
    return state_->drain->get_future();
  }

  [[nodiscard]] executor_type executor() const noexcept { return state_->ex; }

 private:
  using Item = std::variant<T, core::Future<T>>;

  struct Entry {
    Item item;
    core::Context context;
  };

  struct State {
    State(executor_type e, Callback cb, PumpOptions opts)
      : ex(std::move(e)), callback(std::move(cb)), options(std::move(opts)) {}

    executor_type ex;
    Callback callback;
    PumpOptions options;

    std::mutex mu{};
    std::deque<Entry> queue{};
    std::optional<core::Promise<void>> drain{};
  };

  template <typename Fn>
  static Callback adapt_(Fn&& fn) {
    using F = std::decay_t<Fn>;
    if constexpr (std::is_invocable_v<F&, T, core::Context>) {
      if constexpr (std::is_void_v<std::invoke_result_t<F&, T, core::Context>>) {
        return [fn = std::forward<Fn>(fn)](T value, core::Context ctx) mutable -> asio::awaitable<void> {
          core::Context::Scope scope(ctx);
          fn(std::move(value), std::move(ctx));
          co_return;
        };
      } else {
        return [fn = std::forward<Fn>(fn)](T value, core::Context ctx) mutable {
          core::Context::Scope scope(ctx);
          return fn(std::move(value), std::move(ctx));
        };
      }
    } else {
      static_assert(std::is_invocable_v<F&, T>, "MessagePump callback must accept (T) or (T, core::Context)");
      if constexpr (std::is_void_v<std::invoke_result_t<F&, T>>) {
        return [fn = std::forward<Fn>(fn)](T value, core::Context ctx) mutable -> asio::awaitable<void> {
          core::Context::Scope scope(std::move(ctx));
          fn(std::move(value));
          co_return;
        };
      } else {
        return [fn = std::forward<Fn>(fn)](T value, core::Context ctx) mutable {
          core::Context::Scope scope(std::move(ctx));
          return fn(std::move(value));
        };
      }
    }
  }

  void post_(Item item) {
    auto ctx = state_->options.flow_context ? core::Context::current() : core::Context{};
    bool start = false;
    {
      std::lock_guard lk(state_->mu);
      state_->queue.push_back(Entry{std::move(item), std::move(ctx)});
      // 让队列由空变为非空的发布者负责启动处理循环（此时 drain 句柄必然为空）。
      start = state_->queue.size() == 1;
    }
    if (start) {
      asio::co_spawn(state_->ex, run_(state_), asio::detached);
    }
  }

  /*
   * 处理循环：
   * - 队首在处理期间留在队列中，count() 因此包含在途条目；
   * - std::deque 的 push_back/pop_front 不会使其他元素的引用失效，可以在锁外使用队首引用；
   * - 任何挂起点都不持锁。
   */
  static asio::awaitable<void> run_(std::shared_ptr<State> state) {
    for (;;) {
      Entry* entry = nullptr;
      {
        std::lock_guard lk(state->mu);
        entry = &state->queue.front();
      }

      co_await process_(*state, *entry);

      std::optional<core::Promise<void>> drained;
      {
        std::lock_guard lk(state->mu);
        state->queue.pop_front();
        if (!state->queue.empty()) {
          continue;
        }
        drained = std::move(state->drain);
        state->drain.reset();
      }
      if (drained) {
        drained->try_set_value();
      }
      co_return;
    }
  }

  static asio::awaitable<void> process_(State& state, Entry& entry) {
    std::exception_ptr failure;
    try {
      if (entry.item.index() == 0) {
        co_await state.callback(std::move(std::get<0>(entry.item)), entry.context);
      } else {
        const auto& pending = std::get<1>(entry.item);
        (void)co_await pending.async_wait(asio::as_tuple(asio::use_awaitable));
        // 失败时 value() 重新抛出原异常或 std::system_error(error())。
        T value = pending.value();
        co_await state.callback(std::move(value), entry.context);
      }
    } catch (...) {
      failure = std::current_exception();
    }
    if (failure) {
      co_await handle_error_(state, std::move(failure));
    }
  }

  static asio::awaitable<void> handle_error_(State& state, std::exception_ptr failure) {
    if (!state.options.on_error) {
      detail::log_unhandled_failure(failure);
      co_return;
    }
    std::exception_ptr handler_failure;
    try {
      co_await state.options.on_error(failure);
    } catch (...) {
      handler_failure = std::current_exception();
    }
    if (handler_failure) {
      detail::log_handler_failure(handler_failure);
    }
  }

  std::shared_ptr<State> state_;
};

}  // namespace arev::pump
