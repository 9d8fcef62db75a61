#include "arev/pump/delegate_pump.hpp"

#include "arev/core/error.hpp"
#include "core/logger.hpp"

#include <utility>

namespace arev::pump {

DelegatePump::DelegatePump(executor_type ex, PumpOptions options)
  : pump_(
      std::move(ex),
      [](std::shared_ptr<WorkUnit> unit, core::Context ctx) -> asio::awaitable<void> {
        co_await unit->execute(std::move(ctx));
      },
      std::move(options)) {}

void DelegatePump::post(Action action) {
  post(ContextAction([action = std::move(action)](core::Context) { return action(); }));
}

void DelegatePump::post(ContextAction action) { pump_.post(std::make_shared<ActionUnit>(std::move(action))); }

std::error_code DelegatePump::validate_send_(core::duration timeout, const std::stop_token& token) {
  if (!core::is_valid_timeout(timeout) || timeout == core::duration::zero()) {
    core::detail::logger().debug("delegate pump: send rejected, invalid timeout {}ns", timeout.count());
    return core::make_error_code(core::errc::invalid_argument);
  }
  if (token.stop_requested()) {
    core::detail::logger().debug("delegate pump: send rejected, token already stopped");
    return core::make_error_code(core::errc::cancelled);
  }
  return {};
}

}  // 命名空间 arev::pump
