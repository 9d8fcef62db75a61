#pragma once

#include <chrono>

namespace arev::core {

using steady_clock = std::chrono::steady_clock;
using duration = steady_clock::duration;

// 无限等待的哨兵值（对应 -1 毫秒）。
inline constexpr duration kInfinite = std::chrono::milliseconds{-1};

/**
 * @brief 超时参数是否合法。
 *
 * 约定：
 * - kInfinite：永久等待
 * - 0：不阻塞，仅检查当前状态
 * - 正数：相对超时
 * - 其余负数：非法（调用方应返回 errc::invalid_argument）
 */
[[nodiscard]] constexpr bool is_valid_timeout(duration timeout) noexcept {
  return timeout == kInfinite || timeout >= duration::zero();
}

}  // 命名空间 arev::core
