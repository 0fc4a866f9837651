#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace sigma
{

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().get_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}", key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key,
                                                   std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

std::expected<bool, std::string> get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_bool())
    {
        return std::unexpected(std::format("'{}' must be a boolean", key));
    }
    return it->value().as_bool();
}

std::expected<Checksum, std::string> parse_checksum(std::string_view name)
{
    if (name == "none") return Checksum::none;
    if (name == "crc32") return Checksum::crc32;
    return std::unexpected(std::format("'checksum' must be \"none\" or \"crc32\", got \"{}\"", name));
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

Config Config::load_or_defaults(const std::string& filepath)
{
    auto result = load(filepath);
    if (result)
    {
        return *result;
    }
    return load_defaults();
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto it = root.find("codec"); it != root.end() && it->value().is_object())
    {
        const auto& cdc = it->value().as_object();
        if (auto cs = get_string(cdc, "checksum", "none").and_then(parse_checksum); cs)
        {
            config.cdc.checksum = *cs;
        }
        else
        {
            return std::unexpected(cs.error());
        }
    }
    if (auto it = root.find("request"); it != root.end() && it->value().is_object())
    {
        const auto& req = it->value().as_object();
        if (auto gen = get_bool(req, "generate_serno", true); gen)
        {
            config.req.generate_serno = *gen;
        }
        else
        {
            return std::unexpected(gen.error());
        }
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        auto level_name = get_string(log, "level", "info");
        if (!level_name)
        {
            return std::unexpected(level_name.error());
        }
        if (auto lvl = Logger::parse_level(*level_name); lvl)
        {
            config.log.level = *lvl;
        }
        else
        {
            return std::unexpected("'level' must be one of debug, info, warn, error, off");
        }
        if (auto file = get_string(log, "file", ""); file)
        {
            config.log.file = std::move(*file);
        }
        else
        {
            return std::unexpected(file.error());
        }
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        if (auto console = get_bool(log, "enable_console", true); console)
        {
            config.log.enable_console = *console;
        }
        else
        {
            return std::unexpected(console.error());
        }
    }
    return config;
}

} // namespace sigma
