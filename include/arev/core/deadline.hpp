#pragma once

#include "arev/core/common.hpp"
#include "arev/core/future.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <stop_token>
#include <system_error>

namespace arev::core {

/**
 * @brief 让一个待完成的布尔操作与超时、取消信号赛跑。
 *
 * 结果：
 * - op 先完成：原样转发其结果（值、错误码或异常）
 * - 超时先到：false
 * - token 先触发：errc::cancelled
 *
 * 快速路径（不分配竞赛对象）：
 * - 非法超时：errc::invalid_argument
 * - op 已完成，或无限等待且 token 不可停止：直接返回 op
 * - 超时为 0：共享常量 ready_false()
 * - token 已触发：errc::cancelled
 *
 * 竞赛结束时，落败的定时器在其 strand 上被取消、取消注册被立即释放。
 */
[[nodiscard]] Future<bool> wait_with_deadline(
  asio::any_io_executor ex,
  Future<bool> op,
  duration timeout,
  std::stop_token token = {});

/**
 * @brief 把等待结果转换为协程返回的 error_code：
 * true -> {}，false -> errc::timeout，失败 -> 对应错误码。
 */
[[nodiscard]] asio::awaitable<std::error_code> async_wait_signaled(Future<bool> result);

}  // namespace arev::core
