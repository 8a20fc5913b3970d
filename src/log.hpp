//
//  log.hpp
//  aberred
//
//  Created by the aberred authors on 02/10/2025.
//

#pragma once

#include "global.hpp"
#include "fmt/format.h"
#include "flecs.h"
#include <atomic>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <cstring>

#define $Log Log::instance()

#define LOG_LEVELS           \
    X(Debug, "debug")        \
    X(Info, "info")          \
    X(Warning, "warning")    \
    X(Error, "error")

enum class LogLevel: int {
#define X(NAME, STR) NAME,
    LOG_LEVELS
#undef X
};

class Log: public Global<Log> {
    std::atomic<int> _level{static_cast<int>(LogLevel::Info)};
    std::function<void(LogLevel, const std::string&)> _sink;
    std::mutex _mutex;

    static void _flecs_log(int32_t level, const char *file, int32_t line, const char *msg) {
        LogLevel lvl = LogLevel::Info;
        if (level == -2)
            lvl = LogLevel::Warning;
        else if (level <= -3)
            lvl = LogLevel::Error;
        else if (level > 0)
            lvl = LogLevel::Debug;
        if (level < 0 && file) {
            const char *file_ptr = strrchr(file, '/');
            if (!file_ptr)
                file_ptr = strrchr(file, '\\');
            if (file_ptr)
                file = file_ptr + 1;
            $Log.write(lvl, fmt::format("[ECS] {}({}): {}", file, line, msg));
        } else
            $Log.write(lvl, fmt::format("[ECS] {}", msg));
    }

    static void _flecs_abort(void) {
        $Log.write(LogLevel::Error, "[ECS] ecs_os_abort() was called!");
        std::cerr.flush();
    }

public:
    Log() = default;

    static const char* level_name(LogLevel level) {
        switch (level) {
#define X(NAME, STR) case LogLevel::NAME: return STR;
            LOG_LEVELS
#undef X
        }
        return "info";
    }

    static std::optional<LogLevel> parse_level(const std::string& name) {
#define X(NAME, STR) if (name == STR) return LogLevel::NAME;
        LOG_LEVELS
#undef X
        if (name == "warn")
            return LogLevel::Warning;
        return std::nullopt;
    }

    void set_level(LogLevel level) {
        _level.store(static_cast<int>(level));
    }

    LogLevel level() const {
        return static_cast<LogLevel>(_level.load());
    }

    // Redirects output (tests capture warnings this way). An empty function
    // restores the standard streams.
    void set_sink(std::function<void(LogLevel, const std::string&)> sink) {
        std::lock_guard<std::mutex> lock(_mutex);
        _sink = std::move(sink);
    }

    void write(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < _level.load())
            return;
        std::lock_guard<std::mutex> lock(_mutex);
        if (_sink) {
            _sink(level, message);
            return;
        }
        std::ostream& stream = level >= LogLevel::Warning ? std::cerr : std::cout;
        stream << fmt::format("{}: {}\n", level_name(level), message);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        write(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    // Route flecs diagnostics through the same writer
    static void install_ecs_hooks() {
        ecs_os_set_api_defaults();
        ecs_os_api_t os_api = ecs_os_api;
        os_api.abort_ = _flecs_abort;
        os_api.log_ = _flecs_log;
        ecs_os_set_api(&os_api);
        ecs_log_enable_colors(false);
    }
};
