#pragma once

#include <spdlog/spdlog.h>

namespace arev::core::detail {

inline constexpr const char* kLoggerName = "arev";

// 库内部日志器：首次使用时从 spdlog 默认日志器克隆并以 "arev" 注册，
// 业务侧可通过 spdlog::get("arev") 追加 sink。
spdlog::logger& logger();

}  // namespace arev::core::detail
