#include "arev/core/context.hpp"

#include <utility>

namespace arev::core {
namespace {

Context& thread_current() {
  thread_local Context ctx;
  return ctx;
}

}  // 匿名命名空间

Context Context::current() { return thread_current(); }

std::optional<std::string> Context::get(std::string_view key) const {
  if (!values_) {
    return std::nullopt;
  }
  auto it = values_->find(key);
  if (it == values_->end()) {
    return std::nullopt;
  }
  return it->second;
}

Context Context::with(std::string key, std::string value) const {
  auto next = values_ ? std::make_shared<Map>(*values_) : std::make_shared<Map>();
  (*next)[std::move(key)] = std::move(value);
  return Context{std::shared_ptr<const Map>(std::move(next))};
}

bool operator==(const Context& lhs, const Context& rhs) {
  if (lhs.empty() || rhs.empty()) {
    return lhs.empty() && rhs.empty();
  }
  return lhs.values_ == rhs.values_ || *lhs.values_ == *rhs.values_;
}

Context::Scope::Scope(Context ctx) : previous_(std::exchange(thread_current(), std::move(ctx))) {}

Context::Scope::~Scope() { thread_current() = std::move(previous_); }

}  // 命名空间 arev::core
