#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <cstdint>

#include "logger.hpp"
#include "sigma/json.hpp"
#include "sigma/schema.hpp"

namespace sigma
{

namespace json = boost::json;

/**
 * Tool configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct CodecCfg
    {
        Checksum checksum = Checksum::none;
    };

    struct RequestCfg
    {
        bool generate_serno = true;
    };

    using LoggingCfg = Logger::Options;

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath);

    [[nodiscard]] const CodecCfg& codec() const { return cdc; }
    [[nodiscard]] const RequestCfg& request() const { return req; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    [[nodiscard]] SernoPolicy serno_policy() const
    {
        return req.generate_serno ? SernoPolicy::generate : SernoPolicy::require;
    }

private:
    CodecCfg cdc;
    RequestCfg req;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};

} // namespace sigma
