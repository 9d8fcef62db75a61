#pragma once

#include <cstdint>
#include <string_view>

namespace arev::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog（泵的回调失败、迟到信号转发、工作单元过期等），但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 按名称设置日志级别（trace/debug/info/warn/err/critical/off，与 spdlog 一致）。
 *
 * 名称无法识别时返回 false，级别保持不变。
 */
[[nodiscard]] bool set_log_level(std::string_view name);

} // namespace arev::core

