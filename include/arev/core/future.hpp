#pragma once

#include "arev/core/error.hpp"
#include "arev/core/unique_function.hpp"

#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/dispatch.hpp>
#include <asio/execution/outstanding_work.hpp>
#include <asio/post.hpp>
#include <asio/prefer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arev::core {

template <typename T>
class Future;

template <typename T>
class Promise;

namespace detail {

template <typename T>
struct value_storage {
  using type = T;
};

template <>
struct value_storage<void> {
  using type = std::monostate;
};

template <typename T>
struct completion_signature {
  using type = void(std::error_code, T);
};

template <>
struct completion_signature<void> {
  using type = void(std::error_code);
};

/**
 * @brief Promise/Future 共享状态：只允许完成一次（先写者胜）。
 *
 * 完成时先在锁内写入结果并摘下续体列表，再在锁外依次执行续体；
 * 续体参数 already_ready 表示“挂接时状态已经完成”（用于 async_wait 决定 post 还是 dispatch）。
 *
 * add_continuation 返回续体编号，remove_continuation 可在完成前摘下它；
 * 续体已同步执行（挂接时已完成）时编号为 0。
 */
template <typename T>
class SharedState final {
 public:
  using value_type = typename value_storage<T>::type;
  using Continuation = UniqueFunction<void(bool)>;
  using ContinuationId = std::uint64_t;

  [[nodiscard]] bool ready() const noexcept { return ready_.load(std::memory_order_acquire); }

  template <typename... V>
  bool try_resolve(std::error_code ec, std::exception_ptr ex, V&&... value) {
    std::vector<std::pair<ContinuationId, Continuation>> pending;
    {
      std::lock_guard lk(mu_);
      if (ready_.load(std::memory_order_relaxed)) {
        return false;
      }
      ec_ = ec;
      ex_ = std::move(ex);
      if constexpr (sizeof...(V) > 0) {
        value_.emplace(std::forward<V>(value)...);
      }
      ready_.store(true, std::memory_order_release);
      pending.swap(continuations_);
    }
    for (auto& entry : pending) {
      entry.second(false);
    }
    return true;
  }

  ContinuationId add_continuation(Continuation fn) {
    {
      std::lock_guard lk(mu_);
      if (!ready_.load(std::memory_order_relaxed)) {
        const auto id = ++next_id_;
        continuations_.emplace_back(id, std::move(fn));
        return id;
      }
    }
    fn(true);
    return 0;
  }

  // 已完成或编号不存在时为空操作；被摘下的续体在锁外销毁。
  void remove_continuation(ContinuationId id) {
    if (id == 0) {
      return;
    }
    Continuation removed;
    {
      std::lock_guard lk(mu_);
      for (auto it = continuations_.begin(); it != continuations_.end(); ++it) {
        if (it->first == id) {
          removed = std::move(it->second);
          continuations_.erase(it);
          break;
        }
      }
    }
  }

  [[nodiscard]] std::size_t continuation_count() const {
    std::lock_guard lk(mu_);
    return continuations_.size();
  }

  // 以下访问器仅在 ready() 为 true 之后调用。
  [[nodiscard]] const std::error_code& error() const noexcept { return ec_; }
  [[nodiscard]] const std::exception_ptr& exception() const noexcept { return ex_; }
  [[nodiscard]] const std::optional<value_type>& value() const noexcept { return value_; }

 private:
  mutable std::mutex mu_{};
  std::atomic<bool> ready_{false};
  std::error_code ec_{};
  std::exception_ptr ex_{};
  std::optional<value_type> value_{};
  ContinuationId next_id_{0};
  std::vector<std::pair<ContinuationId, Continuation>> continuations_{};
};

}  // namespace detail

/**
 * @brief 待完成结果的只读句柄（可拷贝，可被任意多方观察）。
 *
 * 结果三选一：
 * - 值（T；void 时无值）
 * - 错误码（timeout/cancelled/invalid_argument/broken_promise）
 * - 异常（error() 为 errc::callback_failure，异常本体由 exception() 取得）
 *
 * 观察方式：
 * - then(fn)：同步续体，在完成者线程上执行（已完成则立即执行）
 * - async_wait(token)：asio 异步操作，签名 void(error_code) / void(error_code, T)
 *
 * 相等比较的是“是否同一个共享状态”，用于判断是否返回了同一个句柄。
 */
template <typename T>
class Future final {
 public:
  using value_type = T;
  using signature = typename detail::completion_signature<T>::type;
  using ContinuationId = typename detail::SharedState<T>::ContinuationId;

  Future() = default;

  [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
  [[nodiscard]] bool ready() const noexcept { return state_ && state_->ready(); }

  /**
   * @brief 完成后的错误码；尚未完成时返回空 error_code。
   */
  [[nodiscard]] std::error_code error() const noexcept {
    if (!ready()) {
      return {};
    }
    return state_->error();
  }

  [[nodiscard]] std::exception_ptr exception() const noexcept {
    if (!ready()) {
      return nullptr;
    }
    return state_->exception();
  }

  /**
   * @brief 成功完成后的值。
   *
   * 前置条件：ready() && !error()。
   * 违反时：携带异常则重新抛出，否则抛出 std::system_error(error())。
   */
  template <typename U = T>
    requires(!std::is_void_v<U>)
  [[nodiscard]] const U& value() const {
    if (!ready()) {
      throw std::system_error(make_error_code(errc::invalid_argument), "future is not ready");
    }
    if (state_->exception()) {
      std::rethrow_exception(state_->exception());
    }
    if (state_->error()) {
      throw std::system_error(state_->error());
    }
    return *state_->value();
  }

  /**
   * @brief 挂接同步续体：fn(const Future&)。
   *
   * 续体在完成者线程上、锁外执行；若已完成则在调用线程上立即执行。
   */
  template <typename Fn>
  void then(Fn&& fn) const {
    (void)subscribe(std::forward<Fn>(fn));
  }

  /**
   * @brief 与 then 相同，但返回续体编号，完成前可用 unsubscribe 摘下（同时释放续体捕获的对象）。
   *
   * 已完成时续体立即执行并返回 0。
   */
  template <typename Fn>
  [[nodiscard]] ContinuationId subscribe(Fn&& fn) const {
    return state_->add_continuation([self = *this, fn = std::forward<Fn>(fn)](bool) mutable { fn(self); });
  }

  void unsubscribe(ContinuationId id) const { state_->remove_continuation(id); }

  // 尚未执行的续体数量（诊断用）。
  [[nodiscard]] std::size_t pending_continuations() const { return state_ ? state_->continuation_count() : 0; }

  /**
   * @brief asio 风格的异步等待。
   *
   * - handler 通过其关联执行器派发，等待期间持有该执行器的 outstanding work；
   * - 对已完成的 Future 挂接时，handler 总是被 post（不会在发起调用内部执行）；
   * - 未关联执行器的普通回调会落到 asio::system_executor 上，业务侧通常应使用
   *   asio::bind_executor 或 use_awaitable。
   *
   * 出错时 T 版本的第二个参数为 T{}。
   */
  template <typename CompletionToken>
  auto async_wait(CompletionToken&& token) const {
    return asio::async_initiate<CompletionToken, signature>(
      [state = state_](auto&& handler) {
        using Handler = std::decay_t<decltype(handler)>;
        auto work = asio::prefer(asio::get_associated_executor(handler), asio::execution::outstanding_work.tracked);
        (void)state->add_continuation(
          [state, h = Handler(std::forward<decltype(handler)>(handler)), work = std::move(work)](
            bool already_ready) mutable {
            auto complete = [state, h = std::move(h)]() mutable { deliver_(*state, std::move(h)); };
            if (already_ready) {
              asio::post(work, std::move(complete));
            } else {
              asio::dispatch(work, std::move(complete));
            }
          });
      },
      token);
  }

  friend bool operator==(const Future&, const Future&) = default;

 private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<detail::SharedState<T>> state) : state_(std::move(state)) {}

  template <typename Handler>
  static void deliver_(const detail::SharedState<T>& state, Handler&& handler) {
    if constexpr (std::is_void_v<T>) {
      std::forward<Handler>(handler)(state.error());
    } else {
      if (state.value().has_value()) {
        std::forward<Handler>(handler)(state.error(), *state.value());
      } else {
        std::forward<Handler>(handler)(state.error(), T{});
      }
    }
  }

  std::shared_ptr<detail::SharedState<T>> state_{};
};

/**
 * @brief 结果的写入端（只可移动）。
 *
 * 所有 try_set_* 均为“先写者胜”：已完成时返回 false 且不产生副作用。
 * 未完成即被销毁时，以 errc::broken_promise 完成。
 */
template <typename T>
class Promise final {
 public:
  Promise() : state_(std::make_shared<detail::SharedState<T>>()) {}

  ~Promise() {
    if (state_) {
      (void)state_->try_resolve(make_error_code(errc::broken_promise), nullptr);
    }
  }

  Promise(Promise&&) noexcept = default;
  Promise& operator=(Promise&& other) noexcept {
    if (this != &other) {
      if (state_) {
        (void)state_->try_resolve(make_error_code(errc::broken_promise), nullptr);
      }
      state_ = std::move(other.state_);
    }
    return *this;
  }

  Promise(const Promise&) = delete;
  Promise& operator=(const Promise&) = delete;

  [[nodiscard]] Future<T> get_future() const { return Future<T>{state_}; }
  [[nodiscard]] bool is_resolved() const noexcept { return state_ && state_->ready(); }

  template <typename... V>
    requires(std::is_void_v<T> ? sizeof...(V) == 0 : sizeof...(V) == 1)
  bool try_set_value(V&&... value) {
    return state_->try_resolve(std::error_code{}, nullptr, std::forward<V>(value)...);
  }

  bool try_set_error(std::error_code ec) { return state_->try_resolve(ec, nullptr); }

  bool try_set_exception(std::exception_ptr ex) {
    return state_->try_resolve(make_error_code(errc::callback_failure), std::move(ex));
  }

 private:
  std::shared_ptr<detail::SharedState<T>> state_;
};

template <typename T, typename... V>
[[nodiscard]] Future<T> make_ready_future(V&&... value) {
  Promise<T> p;
  p.try_set_value(std::forward<V>(value)...);
  return p.get_future();
}

template <typename T>
[[nodiscard]] Future<T> make_error_future(std::error_code ec) {
  Promise<T> p;
  p.try_set_error(ec);
  return p.get_future();
}

template <typename T>
[[nodiscard]] Future<T> make_exception_future(std::exception_ptr ex) {
  Promise<T> p;
  p.try_set_exception(std::move(ex));
  return p.get_future();
}

// 进程级不可变常量：已完成的 true / false / void。
[[nodiscard]] Future<bool> ready_true();
[[nodiscard]] Future<bool> ready_false();
[[nodiscard]] Future<void> completed_future();

}  // namespace arev::core
