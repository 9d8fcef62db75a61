#include "arev/core/deadline.hpp"

#include <asio/as_tuple.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>

#include <memory>
#include <mutex>
#include <utility>

namespace arev::core {
namespace {

/*
 * DeadlineRace：一次“操作 vs 定时器 vs 取消”的竞赛。
 *
 * 生命周期：
 * - op 的续体与未完成的定时器 handler 各持有一份强引用；
 * - 定时器或取消获胜时从 op 上摘下续体，竞赛对象随最后一个 handler 释放，
 *   即使 op 永远不完成也不会滞留；
 * - stop_callback 只持有裸指针，触发时通过 weak_from_this() 提升，对象正在析构时直接返回。
 *
 * 定时器绑定在本对象私有的 strand 上：启动与取消都 post 到 strand，
 * 因此可以从任意线程安全地取消。
 *
 * registration_ 必须最后声明：析构时最先销毁，等待可能正在其他线程执行的回调返回。
 */
class DeadlineRace final : public std::enable_shared_from_this<DeadlineRace> {
 public:
  DeadlineRace(const asio::any_io_executor& ex, duration timeout)
    : strand_(asio::make_strand(ex)), timer_(strand_), has_timer_(timeout != kInfinite) {}

  Future<bool> start(Future<bool> op, duration timeout, std::stop_token token) {
    auto result = result_.get_future();

    if (token.stop_possible()) {
      // 若 token 恰好在此刻被触发，回调会在构造函数内同步执行（此时 this 已由 shared_ptr 管理）。
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
        // 取消可能先于启动被 post；已有结果时不再启动定时器。
        if (self->result_.is_resolved()) {
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

    // 最后挂接 op：若 op 已完成，续体会在这里同步执行，此时定时器与注册都已就绪。
    const auto id = op.subscribe([self = shared_from_this()](const Future<bool>& f) { self->on_op_(f); });
    bool detach_now = false;
    {
      std::lock_guard lk(mu_);
      op_ = op;
      if (op_detached_) {
        detach_now = true;
      } else {
        op_subscription_ = id;
      }
    }
    // 定时器或取消在挂接之前已经获胜。
    if (detach_now) {
      op.unsubscribe(id);
    }
    return result;
  }

 private:
  struct StopHandler {
    DeadlineRace* race;

    void operator()() const noexcept {
      if (auto self = race->weak_from_this().lock()) {
        self->on_stop_();
      }
    }
  };

  using Registration = std::stop_callback<StopHandler>;
  using ContinuationId = Future<bool>::ContinuationId;

  void on_op_(const Future<bool>& op) {
    bool won = false;
    if (op.exception()) {
      won = result_.try_set_exception(op.exception());
    } else if (op.error()) {
      won = result_.try_set_error(op.error());
    } else {
      won = result_.try_set_value(op.value());
    }
    if (won) {
      cancel_timer_();
      release_registration_();
    }
  }

  void on_timeout_() {
    if (result_.try_set_value(false)) {
      release_registration_();
      detach_op_();
    }
  }

  // 在取消回调内执行：注册不在这里释放，随对象析构。
  // 摘下 op 续体后对象可能在回调返回前析构，std::stop_callback 允许在自身回调所在线程上销毁。
  void on_stop_() {
    if (result_.try_set_error(make_error_code(errc::cancelled))) {
      cancel_timer_();
      detach_op_();
    }
  }

  void detach_op_() {
    Future<bool> op;
    ContinuationId id = 0;
    {
      std::lock_guard lk(mu_);
      op_detached_ = true;
      op = std::move(op_);
      id = std::exchange(op_subscription_, 0);
    }
    if (id != 0) {
      op.unsubscribe(id);
    }
  }

  void cancel_timer_() {
    if (!has_timer_) {
      return;
    }
    asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
  }

  void release_registration_() {
    std::unique_ptr<Registration> reg;
    {
      std::lock_guard lk(mu_);
      released_ = true;
      reg = std::move(registration_);
    }
    // reg 在锁外析构：若回调正在其他线程执行，析构会等待其返回。
  }

  asio::strand<asio::any_io_executor> strand_;
  asio::steady_timer timer_;
  const bool has_timer_;
  Promise<bool> result_{};
  std::mutex mu_{};
  bool released_{false};
  Future<bool> op_{};
  ContinuationId op_subscription_{0};
  bool op_detached_{false};
  std::unique_ptr<Registration> registration_{};
};

}  // 匿名命名空间

Future<bool> wait_with_deadline(
  asio::any_io_executor ex,
  Future<bool> op,
  duration timeout,
  std::stop_token token) {
  if (!is_valid_timeout(timeout)) {
    return make_error_future<bool>(make_error_code(errc::invalid_argument));
  }
  if (op.ready() || (timeout == kInfinite && !token.stop_possible())) {
    return op;
  }
  if (timeout == duration::zero()) {
    return ready_false();
  }
  if (token.stop_requested()) {
    return make_error_future<bool>(make_error_code(errc::cancelled));
  }

  auto race = std::make_shared<DeadlineRace>(ex, timeout);
  return race->start(std::move(op), timeout, std::move(token));
}

asio::awaitable<std::error_code> async_wait_signaled(Future<bool> result) {
  auto [ec, signaled] = co_await result.async_wait(asio::as_tuple(asio::use_awaitable));
  if (ec) {
    co_return ec;
  }
  if (!signaled) {
    co_return make_error_code(errc::timeout);
  }
  co_return std::error_code{};
}

}  // 命名空间 arev::core
