#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <chrono>
#include <ctime>

namespace idreg
{

class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens `file` in append mode when non-empty; once it grows past
    // max_size_mb it is moved to `<file>.1` and a fresh file is started.
    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    [[nodiscard]] static Level level();
    [[nodiscard]] static Level parse_level(std::string_view lvl);

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        if (level() <= Level::Debug)
        {
            log_msg(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (level() <= Level::Info)
        {
            log_msg(Level::Info, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (level() <= Level::Warn)
        {
            log_msg(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (level() <= Level::Error)
        {
            log_msg(Level::Error, std::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    struct State
    {
        Level lvl = Level::Info;
        std::ofstream file;
        bool console = true;
        std::mutex mtx;
        size_t max_size = 100 * 1024 * 1024;
        size_t written = 0;
        std::string filename;
    };

    static State& instance();
    static std::string_view level_str(Level l);
    static std::string timestamp();
    static void log_msg(Level l, const std::string& msg);
    static void rotate(State& s);
};

} // namespace idreg

#define IDREG_LOG_DEBUG(...) ::idreg::Logger::debug(__VA_ARGS__)
#define IDREG_LOG_INFO(...)  ::idreg::Logger::info(__VA_ARGS__)
#define IDREG_LOG_WARN(...)  ::idreg::Logger::warn(__VA_ARGS__)
#define IDREG_LOG_ERROR(...) ::idreg::Logger::error(__VA_ARGS__)
