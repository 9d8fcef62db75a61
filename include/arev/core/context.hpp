#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arev::core {

/**
 * @brief 不可变的环境上下文快照（键值对）。
 *
 * - 每个线程有一个“当前上下文”（current()），由 Scope 安装/恢复；
 * - with() 返回新快照，原快照不变，因此可以安全地跨线程共享；
 * - MessagePump 在 post 时捕获发布者的 current()，处理该条目时再交给回调。
 */
class Context final {
 public:
  using Map = std::map<std::string, std::string, std::less<>>;

  Context() = default;

  [[nodiscard]] static Context current();

  [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
  [[nodiscard]] Context with(std::string key, std::string value) const;
  [[nodiscard]] bool empty() const noexcept { return !values_ || values_->empty(); }

  friend bool operator==(const Context& lhs, const Context& rhs);

  class Scope;

 private:
  explicit Context(std::shared_ptr<const Map> values) : values_(std::move(values)) {}

  std::shared_ptr<const Map> values_{};
};

/**
 * @brief RAII：在作用域内把指定快照安装为当前线程的上下文，离开时恢复原值。
 */
class Context::Scope final {
 public:
  explicit Scope(Context ctx);
  ~Scope();

  Scope(const Scope&) = delete;
  Scope& operator=(const Scope&) = delete;

 private:
  Context previous_;
};

}  // namespace arev::core
