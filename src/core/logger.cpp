/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace bim::core {

    namespace {

        constexpr const char* LOG_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %s:%# %v";

        spdlog::level::level_enum to_spdlog_level(const LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }

        LogModule detect_module(std::string_view path) {
            if (path.find("/interaction/") != std::string_view::npos)
                return LogModule::Interaction;
            if (path.find("/rendering/") != std::string_view::npos)
                return LogModule::Rendering;
            if (path.find("/io/") != std::string_view::npos)
                return LogModule::Loader;
            if (path.find("/app/") != std::string_view::npos)
                return LogModule::App;
            if (path.find("scene") != std::string_view::npos)
                return LogModule::Scene;
            if (path.find("/core/") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        std::string_view short_file_name(std::string_view path) {
            const auto pos = path.find_last_of("/\\");
            return pos == std::string_view::npos ? path : path.substr(pos + 1);
        }

        // Glob match supporting '*' and '?'
        bool glob_match(std::string_view pattern, std::string_view text) {
            size_t p = 0, t = 0;
            size_t star = std::string_view::npos, mark = 0;
            while (t < text.size()) {
                if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
                    ++p;
                    ++t;
                } else if (p < pattern.size() && pattern[p] == '*') {
                    star = p++;
                    mark = t;
                } else if (star != std::string_view::npos) {
                    p = star + 1;
                    t = ++mark;
                } else {
                    return false;
                }
            }
            while (p < pattern.size() && pattern[p] == '*')
                ++p;
            return p == pattern.size();
        }

    } // namespace

    LogLevel parse_log_level(const std::string_view name) {
        if (name == "perf")
            return LogLevel::Performance;
        if (name == "warning")
            return LogLevel::Warn;
        for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
            const auto level = static_cast<LogLevel>(i);
            if (name == log_level_name(level))
                return level;
        }
        return LogLevel::Info;
    }

    std::string_view log_level_name(const LogLevel level) {
        switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Performance: return "performance";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
        }
        return "info";
    }

    struct Logger::Impl {
        std::mutex mutex;
        std::shared_ptr<spdlog::logger> logger;
        std::string filter_pattern;
    };

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger() : impl_(std::make_unique<Impl>()) {
        for (size_t i = 0; i < module_enabled_.size(); ++i) {
            module_enabled_[i].store(true);
            module_level_[i].store(static_cast<uint8_t>(LogLevel::Trace));
        }
    }

    Logger::~Logger() {
        if (impl_ && impl_->logger) {
            impl_->logger->flush();
        }
    }

    void Logger::init(const LoggerOptions& options) {
        const std::lock_guard lock(impl_->mutex);
        const LogLevel console_level = options.console_level;
        const std::string& log_file = options.file;

        std::vector<spdlog::sink_ptr> sinks;
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(console_level));
        sinks.push_back(console_sink);

        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        impl_->logger = std::make_shared<spdlog::logger>("bimscope", sinks.begin(), sinks.end());
        impl_->logger->set_pattern(LOG_PATTERN);
        impl_->logger->set_level(spdlog::level::trace);
        impl_->logger->flush_on(spdlog::level::err);
        impl_->filter_pattern = options.filter_pattern;
        if (!file_error.empty()) {
            impl_->logger->warn("Cannot open log file '{}': {}", log_file, file_error);
        }

        // File sink receives everything, so the gate is the lower of the two
        const LogLevel gate = (log_file.empty() || !file_error.empty()) ? console_level : LogLevel::Trace;
        threshold_.store(static_cast<uint8_t>(gate), std::memory_order_relaxed);
    }

    void Logger::log(const LogLevel level, const std::source_location& loc, const std::string_view msg) {
        const auto module = detect_module(loc.file_name());
        const auto module_idx = static_cast<size_t>(module);
        if (!module_enabled_[module_idx].load(std::memory_order_relaxed))
            return;
        if (static_cast<uint8_t>(level) < module_level_[module_idx].load(std::memory_order_relaxed))
            return;

        const std::lock_guard lock(impl_->mutex);
        if (!impl_->logger) {
            impl_->logger = spdlog::stdout_color_mt("bimscope");
            impl_->logger->set_pattern(LOG_PATTERN);
            impl_->logger->set_level(spdlog::level::trace);
        }

        if (!impl_->filter_pattern.empty() && !glob_match(impl_->filter_pattern, msg))
            return;

        const spdlog::source_loc src{short_file_name(loc.file_name()).data(),
                                     static_cast<int>(loc.line()),
                                     loc.function_name()};
        if (level == LogLevel::Performance) {
            impl_->logger->log(src, spdlog::level::info, std::format("[PERF] {}", msg));
        } else {
            impl_->logger->log(src, to_spdlog_level(level), msg);
        }
    }

    void Logger::enable_module(const LogModule module, const bool enabled) {
        module_enabled_[static_cast<size_t>(module)].store(enabled);
    }

    void Logger::set_module_level(const LogModule module, const LogLevel level) {
        module_level_[static_cast<size_t>(module)].store(static_cast<uint8_t>(level));
    }

    void Logger::set_level(const LogLevel level) {
        threshold_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
        const std::lock_guard lock(impl_->mutex);
        if (impl_->logger && !impl_->logger->sinks().empty()) {
            impl_->logger->sinks().front()->set_level(to_spdlog_level(level));
        }
    }

    void Logger::flush() {
        const std::lock_guard lock(impl_->mutex);
        if (impl_->logger) {
            impl_->logger->flush();
        }
    }

    ScopedTimer::ScopedTimer(std::string name, const LogLevel level, const std::source_location loc)
        : start_(std::chrono::steady_clock::now()),
          name_(std::move(name)),
          level_(level),
          loc_(loc) {}

    ScopedTimer::~ScopedTimer() {
        const auto elapsed = std::chrono::steady_clock::now() - start_;
        const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        Logger::get().write(level_, loc_, "{} took {:.3f} ms", name_, ms);
    }

} // namespace bim::core
