#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace arev::core {

template <typename Signature>
class UniqueFunction;

/**
 * @brief 只可移动的类型擦除可调用对象。
 *
 * std::function 要求可拷贝，而 asio 的完成处理器（例如 use_awaitable 生成的
 * handler）只可移动，Future 的续体列表因此使用本类型保存。
 */
template <typename R, typename... Args>
class UniqueFunction<R(Args...)> final {
 public:
  UniqueFunction() = default;

  template <typename Fn>
    requires(!std::is_same_v<std::decay_t<Fn>, UniqueFunction> && std::is_invocable_r_v<R, std::decay_t<Fn>&, Args...>)
  UniqueFunction(Fn&& fn)  // NOLINT：允许从 lambda 隐式构造
    : impl_(std::make_unique<Impl<std::decay_t<Fn>>>(std::forward<Fn>(fn))) {}

  UniqueFunction(UniqueFunction&&) noexcept = default;
  UniqueFunction& operator=(UniqueFunction&&) noexcept = default;

  UniqueFunction(const UniqueFunction&) = delete;
  UniqueFunction& operator=(const UniqueFunction&) = delete;

  explicit operator bool() const noexcept { return impl_ != nullptr; }

  R operator()(Args... args) { return impl_->call(std::forward<Args>(args)...); }

 private:
  struct Base {
    virtual ~Base() = default;
    virtual R call(Args&&... args) = 0;
  };

  template <typename Fn>
  struct Impl final : Base {
    template <typename F>
    explicit Impl(F&& f) : fn(std::forward<F>(f)) {}

    R call(Args&&... args) override { return std::invoke(fn, std::forward<Args>(args)...); }

    Fn fn;
  };

  std::unique_ptr<Base> impl_{};
};

}  // namespace arev::core
