#include "config.hpp"
#include "logger.hpp"
#include "sigma/codec.hpp"
#include "sigma/json.hpp"
#include "fundamentals/bytes.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/json.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace sigma;

namespace {

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  encode <request.json>     Print the wire form of a request as hex");
    std::println("  decode <hex>              Print a response wire buffer as JSON");
    std::println("  validate <request.json>   Check a request against its schema");
}

std::expected<SigmaRequest, std::string> load_request(const std::string& path, const Config& cfg)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    boost::system::error_code ec;
    auto jv = boost::json::parse(buffer.str(), ec);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error in {}: {}", path, ec.message()));
    }

    auto req = request_from_json(jv, cfg.serno_policy());
    if (!req)
    {
        return std::unexpected(req.error().message());
    }
    return std::move(*req);
}

int cmd_encode(const Config& cfg, const Schema& schema, const std::string& path)
{
    auto req = load_request(path, cfg);
    if (!req)
    {
        std::println(stderr, "{}", req.error());
        return 1;
    }

    auto wire = codec::encode(*req, schema);
    if (!wire)
    {
        std::println(stderr, "Encode failed: {}", describe(wire.error()));
        return 1;
    }

    SIGMA_LOG_DEBUG("tool", "Encoded serno {} into {} bytes", req->auth_serno().value_or(0), wire->size());

    std::string hex;
    boost::algorithm::hex(reinterpret_cast<const char*>(wire->data()),
                          reinterpret_cast<const char*>(wire->data() + wire->size()),
                          std::back_inserter(hex));
    std::println("{}", hex);
    return 0;
}

int cmd_decode(const Schema& schema, std::string_view hex)
{
    std::string raw;
    try
    {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(raw));
    }
    catch (const boost::algorithm::hex_decode_error&)
    {
        std::println(stderr, "Input is not a valid hex string");
        return 1;
    }

    auto data = bytes::to_bytes(raw);
    auto resp = codec::decode_response(data, schema);
    if (!resp)
    {
        std::println(stderr, "Decode failed: {}", resp.error().message());
        return 1;
    }

    SIGMA_LOG_DEBUG("tool", "Decoded response for serno {}", resp->auth_serno());
    std::println("{}", boost::json::serialize(to_json(*resp)));
    return 0;
}

int cmd_validate(const Config& cfg, const Schema& schema, const std::string& path)
{
    auto req = load_request(path, cfg);
    if (!req)
    {
        std::println(stderr, "{}", req.error());
        return 1;
    }

    if (auto ok = validate(req->to_message(), schema); !ok)
    {
        std::println(stderr, "Invalid request: {}", ok.error().message());
        return 1;
    }
    std::println("Request is valid");
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::optional<std::string> config_path;

    if (args.size() >= 2 && args[0] == "--config")
    {
        config_path = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.size() != 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    // An explicit --config must load; the default file is optional
    Config config = Config::load_defaults();
    if (config_path)
    {
        auto loaded = Config::load(*config_path);
        if (!loaded)
        {
            std::println(stderr, "{}", loaded.error());
            return 1;
        }
        config = std::move(*loaded);
    }
    else
    {
        config = Config::load_or_defaults("sigma_config.json");
    }

    if (auto result = Logger::init(config.logging()); !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    const std::string& cmd = args[0];
    int rc = 1;

    try
    {
        if (cmd == "encode")
        {
            auto schema = Schema::describe(MessageKind::request).with_checksum(config.codec().checksum);
            rc = cmd_encode(config, schema, args[1]);
        }
        else if (cmd == "decode")
        {
            auto schema = Schema::describe(MessageKind::response).with_checksum(config.codec().checksum);
            rc = cmd_decode(schema, args[1]);
        }
        else if (cmd == "validate")
        {
            rc = cmd_validate(config, Schema::describe(MessageKind::request), args[1]);
        }
        else
        {
            print_usage(argv[0]);
        }
    }
    catch (const SchemaDefect& e)
    {
        SIGMA_LOG_ERROR("tool", "Fatal: {}", e.what());
        Logger::shutdown();
        return 1;
    }

    Logger::shutdown();
    return rc;
}
