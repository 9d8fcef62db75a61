#include "arev/event/manual_reset_event.hpp"

#include "arev/core/deadline.hpp"
#include "arev/core/error.hpp"

#include <asio/post.hpp>

#include <utility>

namespace arev::event {

ManualResetEvent::ManualResetEvent(executor_type ex, bool signaled)
  : ex_(std::move(ex)), generation_(std::make_shared<core::Promise<bool>>()) {
  if (signaled) {
    generation_.load()->try_set_value(true);
  }
}

core::Future<bool> ManualResetEvent::wait(std::stop_token token) {
  return wait(core::kInfinite, std::move(token));
}

core::Future<bool> ManualResetEvent::wait(core::duration timeout, std::stop_token token) {
  if (!core::is_valid_timeout(timeout)) {
    return core::make_error_future<bool>(core::make_error_code(core::errc::invalid_argument));
  }
  if (token.stop_requested()) {
    return core::make_error_future<bool>(core::make_error_code(core::errc::cancelled));
  }

  const auto gen = generation_.load();
  if (timeout == core::duration::zero()) {
    return gen->is_resolved() ? core::ready_true() : core::ready_false();
  }
  return core::wait_with_deadline(ex_, gen->get_future(), timeout, std::move(token));
}

void ManualResetEvent::set(bool run_inline) {
  auto gen = generation_.load();
  if (run_inline) {
    gen->try_set_value(true);
    return;
  }
  asio::post(ex_, [gen = std::move(gen)]() { gen->try_set_value(true); });
}

void ManualResetEvent::reset() {
  auto current = generation_.load();
  std::shared_ptr<core::Promise<bool>> fresh;
  // 失败时 compare_exchange_weak 会把最新值写回 current，循环条件随之重新判断。
  while (current->is_resolved()) {
    if (!fresh) {
      fresh = std::make_shared<core::Promise<bool>>();
    }
    if (generation_.compare_exchange_weak(current, fresh)) {
      return;
    }
  }
}

bool ManualResetEvent::is_set() const noexcept { return generation_.load()->is_resolved(); }

asio::awaitable<std::error_code> ManualResetEvent::async_wait(core::duration timeout, std::stop_token token) {
  co_return co_await core::async_wait_signaled(wait(timeout, std::move(token)));
}

}  // 命名空间 arev::event
