#pragma once

#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <expected>
#include <format>
#include <chrono>
#include <ctime>

namespace sigma
{

/**
 * Process-wide logger. Lines look like
 *   [2026-01-01 12:00:00.000] [WARN] [exchange] reply for serno 42 timed out
 * and go to the console, an optional file, or both.
 */
class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error, Off };

    struct Options
    {
        Level level = Level::Info;
        std::string file = "";         // empty: no file sink
        size_t max_size_mb = 100;      // file is rotated to "<file>.1" past this size
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<void, std::string> init(const Options& opts);
    static void shutdown();

    [[nodiscard]] static Level level();
    [[nodiscard]] static bool enabled(Level l) { return l != Level::Off && level() <= l; }

    [[nodiscard]] static std::optional<Level> parse_level(std::string_view name);
    [[nodiscard]] static std::string_view level_name(Level l);

    template<typename... Args>
    static void write(Level l, std::string_view component, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            log_msg(l, component, std::format(fmt, std::forward<Args>(args)...));
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
    static std::string timestamp();
    static void rotate(State& s);
    static void log_msg(Level l, std::string_view component, const std::string& msg);
};

} // namespace sigma

#define SIGMA_LOG_DEBUG(component, ...) ::sigma::Logger::write(::sigma::Logger::Level::Debug, component, __VA_ARGS__)
#define SIGMA_LOG_INFO(component, ...)  ::sigma::Logger::write(::sigma::Logger::Level::Info, component, __VA_ARGS__)
#define SIGMA_LOG_WARN(component, ...)  ::sigma::Logger::write(::sigma::Logger::Level::Warn, component, __VA_ARGS__)
#define SIGMA_LOG_ERROR(component, ...) ::sigma::Logger::write(::sigma::Logger::Level::Error, component, __VA_ARGS__)
