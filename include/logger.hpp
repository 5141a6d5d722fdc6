#pragma once

#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <chrono>
#include <ctime>

class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();
    static void set_level(std::string_view level);

    [[nodiscard]] static bool enabled(Level l) { return instance().lvl.load(std::memory_order_relaxed) <= l; }

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        emit(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args)
    {
        emit(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        emit(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args)
    {
        emit(Level::Error, fmt, std::forward<Args>(args)...);
    }

private:
    // Formatting is skipped entirely below the threshold: arguments may be costly to render.
    template<typename... Args>
    static void emit(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            log_msg(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    struct State
    {
        std::atomic<Level> lvl{Level::Info};
        std::ofstream file;
        bool console = true;
        std::mutex mtx;
        size_t max_size = 100 * 1024 * 1024;
        size_t written = 0;
        std::string filename;
    };

    static State& instance();
    static Level parse_level(std::string_view lvl);
    static std::string_view level_str(Level l);
    static std::string timestamp();
    static std::string thread_tag();
    static void log_msg(Level l, const std::string& msg);
    static void rotate_locked(State& s);
};

#define LOG_DEBUG(...) Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::error(__VA_ARGS__)
