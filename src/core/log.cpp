#include "arev/core/log.hpp"

#include "logger.hpp"

#include <memory>
#include <string>

namespace arev::core {
namespace {

struct LevelMapping {
    LogLevel level;
    spdlog::level::level_enum native;
};

constexpr LevelMapping kLevels[] = {
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    for (const auto& m : kLevels) {
        if (m.level == level) {
            return m.native;
        }
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (const auto& m : kLevels) {
        if (m.native == level) {
            return m.level;
        }
    }
    return LogLevel::off;
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(detail::kLoggerName)) {
        return existing;
    }
    auto created = spdlog::default_logger()->clone(detail::kLoggerName);
    spdlog::register_logger(created);
    return created;
}

} // namespace

namespace detail {

spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    // 只调整库自己的日志器，不影响业务侧对 spdlog 默认日志器的配置。
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger().level()); }

bool set_log_level(std::string_view name) {
    // spdlog 对未知名称返回 off，需要与显式的 "off" 区分。
    const auto native = spdlog::level::from_str(std::string(name));
    if (native == spdlog::level::off && name != "off") {
        return false;
    }
    detail::logger().set_level(native);
    return true;
}

} // namespace arev::core
