#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace daicgate {

/// Process-wide diagnostic logger. Writes to stderr only; stdout belongs to
/// the structured hook output.
class Logger {
public:
    static void init(std::string_view name = "daicgate", std::string_view level = "warn");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace daicgate

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::daicgate::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::daicgate::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::daicgate::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::daicgate::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::daicgate::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::daicgate::Logger::get(), __VA_ARGS__)
