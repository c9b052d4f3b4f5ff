/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include "core/export.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace bim::core {

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    // Derived from the calling source file's directory
    enum class LogModule : uint8_t {
        Core,
        Scene,
        Loader,
        Rendering,
        Interaction,
        App,
        Unknown,
        Count
    };

    struct LoggerOptions {
        LogLevel console_level = LogLevel::Info;
        std::string file;           // empty: console only; the file sink takes every level
        std::string filter_pattern; // glob over the message text, '*' and '?'
    };

    /// Unknown names map to Info
    [[nodiscard]] BIM_LOGGER_API LogLevel parse_log_level(std::string_view name);
    [[nodiscard]] BIM_LOGGER_API std::string_view log_level_name(LogLevel level);

    class BIM_LOGGER_API Logger {
    public:
        static Logger& get();

        void init(const LoggerOptions& options = {});

        void log(LogLevel level, const std::source_location& loc, std::string_view msg);

        void enable_module(LogModule module, bool enabled = true);
        void set_module_level(LogModule module, LogLevel level);
        void set_level(LogLevel level);
        void flush();

        [[nodiscard]] LogLevel level() const {
            return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
        }
        [[nodiscard]] bool passes(LogLevel level) const {
            return static_cast<uint8_t>(level) >= threshold_.load(std::memory_order_relaxed);
        }

        void write(LogLevel level, const std::source_location& loc, const std::string& msg) {
            if (passes(level))
                log(level, loc, msg);
        }

        // Formatting happens only after the threshold check
        template <typename... Args>
        void write(LogLevel level, const std::source_location& loc,
                   std::format_string<Args...> fmt, Args&&... args) {
            if (passes(level))
                log(level, loc, std::format(fmt, std::forward<Args>(args)...));
        }

    private:
        Logger();
        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        struct Impl;
        std::unique_ptr<Impl> impl_;

        std::atomic<uint8_t> threshold_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Logs "<name> took N ms" at the given level when destroyed
    class BIM_LOGGER_API ScopedTimer {
    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current());
        ~ScopedTimer();

    private:
        std::chrono::steady_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;
    };

} // namespace bim::core

#define BIM_LOG_AT(level, ...) \
    ::bim::core::Logger::get().write(::bim::core::LogLevel::level, std::source_location::current(), __VA_ARGS__)

#define LOG_TRACE(...)    BIM_LOG_AT(Trace, __VA_ARGS__)
#define LOG_DEBUG(...)    BIM_LOG_AT(Debug, __VA_ARGS__)
#define LOG_INFO(...)     BIM_LOG_AT(Info, __VA_ARGS__)
#define LOG_PERF(...)     BIM_LOG_AT(Performance, __VA_ARGS__)
#define LOG_WARN(...)     BIM_LOG_AT(Warn, __VA_ARGS__)
#define LOG_ERROR(...)    BIM_LOG_AT(Error, __VA_ARGS__)
#define LOG_CRITICAL(...) BIM_LOG_AT(Critical, __VA_ARGS__)

// Two levels so __COUNTER__ expands before pasting
#define BIM_LOG_CONCAT_IMPL(x, y) x##y
#define BIM_LOG_CONCAT(x, y)      BIM_LOG_CONCAT_IMPL(x, y)

#define LOG_TIMER(name)       ::bim::core::ScopedTimer BIM_LOG_CONCAT(log_timer_, __COUNTER__)(name)
#define LOG_TIMER_TRACE(name) ::bim::core::ScopedTimer BIM_LOG_CONCAT(log_timer_, __COUNTER__)(name, ::bim::core::LogLevel::Trace)
#define LOG_TIMER_DEBUG(name) ::bim::core::ScopedTimer BIM_LOG_CONCAT(log_timer_, __COUNTER__)(name, ::bim::core::LogLevel::Debug)
