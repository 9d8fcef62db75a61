#include "arev/pump/message_pump.hpp"

#include "arev/core/error.hpp"
#include "core/logger.hpp"

namespace arev::pump::detail {

void log_unhandled_failure(const std::exception_ptr& failure) {
  core::detail::logger().warn("message pump: unhandled item failure: {}", core::describe_exception(failure));
}

void log_handler_failure(const std::exception_ptr& failure) {
  core::detail::logger().warn("message pump: error handler failed: {}", core::describe_exception(failure));
}

}  // 命名空间 arev::pump::detail
