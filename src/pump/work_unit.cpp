#include "arev/pump/work_unit.hpp"

#include "core/logger.hpp"

#include <asio/error.hpp>
#include <asio/post.hpp>

#include <utility>

namespace arev::pump {

asio::awaitable<void> ActionUnit::execute(core::Context ctx) {
  co_await detail::start_in_context(action_, ctx);
}

bool is_cancellation(const std::error_code& ec) noexcept {
  return ec == core::errc::cancelled || ec == asio::error::operation_aborted;
}

GuardedUnit::GuardedUnit(const asio::any_io_executor& ex) : strand_(asio::make_strand(ex)), timer_(strand_) {}

void GuardedUnit::StopHandler::operator()() const noexcept {
  // 单元正在析构时提升失败，直接返回。
  if (auto self = unit->weak_from_this().lock()) {
    self->on_stop_();
  }
}

void GuardedUnit::arm(core::duration timeout, std::stop_token token) {
  has_timer_ = timeout != core::kInfinite;

  if (token.stop_possible()) {
    auto reg = std::make_unique<Registration>(std::move(token), StopHandler{this});
    std::unique_ptr<Registration> discard;
    {
      std::lock_guard lk(mu_);
      if (released_) {
        discard = std::move(reg);
      } else {
        registration_ = std::move(reg);
      }
    }
  }

  if (has_timer_) {
    asio::post(strand_, [self = shared_from_this(), timeout]() {
      if (self->state() != UnitState::pending) {
        return;
      }
      self->timer_.expires_after(timeout);
      self->timer_.async_wait([self](const std::error_code& ec) {
        if (!ec) {
          self->on_timeout_();
        }
      });
    });
  }
}

asio::awaitable<void> GuardedUnit::execute(core::Context ctx) {
  if (!claim_(UnitState::started)) {
    // 已超时或已取消，结果已经写入，跳过。
    co_return;
  }
  cancel_timer_();
  release_registration_();
  co_await run_(std::move(ctx));
}

bool GuardedUnit::claim_(UnitState to) noexcept {
  auto expected = UnitState::pending;
  return state_.compare_exchange_strong(expected, to, std::memory_order_acq_rel);
}

void GuardedUnit::on_timeout_() {
  if (!claim_(UnitState::terminal)) {
    return;
  }
  release_registration_();
  core::detail::logger().debug("delegate pump: work unit expired before start");
  expire_(core::make_error_code(core::errc::timeout));
}

// 在取消回调内部执行：不能销毁自身所在的注册，它随单元一起释放。
void GuardedUnit::on_stop_() {
  if (!claim_(UnitState::terminal)) {
    return;
  }
  cancel_timer_();
  core::detail::logger().debug("delegate pump: work unit cancelled before start");
  expire_(core::make_error_code(core::errc::cancelled));
}

void GuardedUnit::cancel_timer_() {
  if (!has_timer_) {
    return;
  }
  asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void GuardedUnit::release_registration_() {
  std::unique_ptr<Registration> reg;
  {
    std::lock_guard lk(mu_);
    released_ = true;
    reg = std::move(registration_);
  }
}

}  // 命名空间 arev::pump
