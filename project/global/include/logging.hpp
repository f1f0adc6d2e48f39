#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

// 通用日志函数模板
template <typename... Args>
void log_info(fmt::format_string<Args...> fmt, Args&&... args) {
    spdlog::info(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> fmt, Args&&... args) {
    spdlog::debug(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> fmt, Args&&... args) {
    spdlog::warn(fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> fmt, Args&&... args) {
    spdlog::error(fmt, std::forward<Args>(args)...);
}

// 控制台日志, level 取 trace/debug/info/warn/error/off
inline void init_logging(const std::string& level) {
    auto console = spdlog::get("linechat");
    if (!console) {
        console = spdlog::stdout_color_mt("linechat");
        console->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::from_str(level));
}
