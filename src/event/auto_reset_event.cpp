#include "arev/event/auto_reset_event.hpp"

#include "arev/core/deadline.hpp"
#include "arev/core/error.hpp"
#include "core/logger.hpp"

#include <asio/post.hpp>

#include <utility>

namespace arev::event {

AutoResetEvent::AutoResetEvent(executor_type ex) : state_(std::make_shared<State>(std::move(ex))) {}

// 未完成的等待者以 broken_promise 完成；转发续体此时已无法提升 state_，不会再放行。
AutoResetEvent::~AutoResetEvent() = default;

core::Future<bool> AutoResetEvent::wait(std::stop_token token) { return wait(core::kInfinite, std::move(token)); }

core::Future<bool> AutoResetEvent::wait(core::duration timeout, std::stop_token token) {
  if (!core::is_valid_timeout(timeout)) {
    return core::make_error_future<bool>(core::make_error_code(core::errc::invalid_argument));
  }
  if (token.stop_requested()) {
    return core::make_error_future<bool>(core::make_error_code(core::errc::cancelled));
  }

  core::Future<bool> waiter;
  {
    std::lock_guard lk(state_->mu);
    if (state_->signaled) {
      state_->signaled = false;
      return core::ready_true();
    }
    if (timeout == core::duration::zero()) {
      return core::ready_false();
    }
    state_->waiters.emplace_back();
    waiter = state_->waiters.back().get_future();
  }

  if (timeout == core::kInfinite && !token.stop_possible()) {
    return waiter;
  }

  auto result = core::wait_with_deadline(state_->ex, waiter, timeout, std::move(token));
  result.then([weak = std::weak_ptr<State>(state_), waiter](const core::Future<bool>& r) {
    forward_release_(weak, r, waiter);
  });
  return result;
}

/*
 * 竞赛以超时/取消结束时，等待者仍在队列中。
 * 轮到它时收到的 true 不再有人观察，于是重新进入放行循环，交给下一个等待者或置位。
 */
void AutoResetEvent::forward_release_(
  std::weak_ptr<State> state,
  const core::Future<bool>& result,
  core::Future<bool> waiter) {
  if (!result.error() && result.value()) {
    return;
  }
  waiter.then([state = std::move(state)](const core::Future<bool>& w) {
    if (w.error() || !w.value()) {
      return;
    }
    auto self = state.lock();
    if (!self) {
      return;
    }
    core::detail::logger().debug("auto-reset event: forwarding release of an abandoned waiter");
    release_(self, true);
  });
}

void AutoResetEvent::set(bool run_inline) { release_(state_, run_inline); }

/*
 * 被放行的等待者若已放弃，其转发续体会在 try_set_value 内部再次进入本函数；
 * 此时 releasing 为 true，只登记一次放行，由外层循环继续处理，不会递归加深调用栈。
 */
void AutoResetEvent::release_(const std::shared_ptr<State>& state, bool run_inline) {
  std::unique_lock lk(state->mu);
  if (run_inline) {
    ++state->pending_inline;
  } else {
    ++state->pending_posted;
  }
  if (state->releasing) {
    return;
  }
  state->releasing = true;

  while (state->pending_inline + state->pending_posted > 0) {
    const bool inline_release = state->pending_inline > 0;
    if (inline_release) {
      --state->pending_inline;
    } else {
      --state->pending_posted;
    }
    if (state->waiters.empty()) {
      state->signaled = true;
      continue;
    }
    auto released = std::move(state->waiters.front());
    state->waiters.pop_front();

    lk.unlock();
    if (inline_release) {
      released.try_set_value(true);
    } else {
      asio::post(state->ex, [p = std::move(released)]() mutable { p.try_set_value(true); });
    }
    lk.lock();
  }
  state->releasing = false;
}

bool AutoResetEvent::is_set() const {
  std::lock_guard lk(state_->mu);
  return state_->signaled;
}

std::size_t AutoResetEvent::waiter_count() const {
  std::lock_guard lk(state_->mu);
  return state_->waiters.size();
}

asio::awaitable<std::error_code> AutoResetEvent::async_wait(core::duration timeout, std::stop_token token) {
  co_return co_await core::async_wait_signaled(wait(timeout, std::move(token)));
}

}  // 命名空间 arev::event
