#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>

namespace sigma
{

Logger::State& Logger::instance()
{
    static State s;
    return s;
}

Logger::Level Logger::level()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.lvl;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    std::ranges::transform(name, std::back_inserter(lower),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "off") return Level::Off;
    return std::nullopt;
}

std::string_view Logger::level_name(Level l)
{
    switch (l)
    {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "INFO";
}

std::string Logger::timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm;
    localtime_r(&time, &tm);
    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
}

std::expected<void, std::string> Logger::init(const Options& opts)
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.lvl = opts.level;
    s.console = opts.enable_console;
    s.max_size = opts.max_size_mb * 1024 * 1024;
    s.filename = opts.file;
    s.file.close();
    s.written = 0;
    if (s.filename.empty())
    {
        return {};
    }

    s.file.open(s.filename, std::ios::app);
    if (!s.file.is_open())
    {
        return std::unexpected(std::format("Failed to open log file: {}", s.filename));
    }
    // Appending to an existing log counts toward its rotation size
    std::error_code ec;
    auto existing = std::filesystem::file_size(s.filename, ec);
    s.written = ec ? 0 : static_cast<size_t>(existing);
    return {};
}

void Logger::shutdown()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.file.close();
    s.filename.clear();
}

void Logger::rotate(State& s)
{
    s.file.close();
    std::error_code ec;
    std::filesystem::rename(s.filename, s.filename + ".1", ec);
    if (ec)
    {
        std::cerr << std::format("Log rotation of {} failed: {}\n", s.filename, ec.message());
        s.file.open(s.filename, std::ios::app);
    }
    else
    {
        s.file.open(s.filename, std::ios::trunc);
    }
    s.written = 0;
}

void Logger::log_msg(Level l, std::string_view component, const std::string& msg)
{
    State& s = instance();
    std::string line = std::format("[{}] [{}] [{}] {}\n", timestamp(), level_name(l), component, msg);

    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console)
    {
        auto& out = (l >= Level::Warn) ? std::cerr : std::cout;
        out << line;
    }
    if (s.file.is_open())
    {
        if (s.max_size > 0 && s.written + line.size() > s.max_size)
        {
            rotate(s);
        }
        s.file << line;
        s.file.flush();
        s.written += line.size();
    }
}

} // namespace sigma
