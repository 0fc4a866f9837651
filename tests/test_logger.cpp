#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace sigma;

namespace {

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

void reset_logger()
{
    Logger::shutdown();
    REQUIRE(Logger::init({.level = Logger::Level::Info, .file = "", .max_size_mb = 100, .enable_console = false}));
}

} // namespace

TEST_CASE("Logger::parse_level accepts level names in any case")
{
    CHECK(Logger::parse_level("debug") == Logger::Level::Debug);
    CHECK(Logger::parse_level("Info") == Logger::Level::Info);
    CHECK(Logger::parse_level("WARNING") == Logger::Level::Warn);
    CHECK(Logger::parse_level("error") == Logger::Level::Error);
    CHECK(Logger::parse_level("off") == Logger::Level::Off);
    CHECK_FALSE(Logger::parse_level("verbose").has_value());
}

TEST_CASE("Logger writes enabled levels with their component")
{
    const std::string log_file = "/tmp/test_sigma_logger.log";
    fs::remove(log_file);

    REQUIRE(Logger::init({.level = Logger::Level::Warn, .file = log_file, .max_size_mb = 1, .enable_console = false}));
    CHECK(Logger::level() == Logger::Level::Warn);
    CHECK_FALSE(Logger::enabled(Logger::Level::Info));

    SIGMA_LOG_INFO("codec", "serno {} encoded", 42);
    SIGMA_LOG_WARN("exchange", "serno {} timed out", 43);
    Logger::shutdown();

    auto content = read_file(log_file);
    CHECK(content.find("serno 42") == std::string::npos);
    CHECK(content.find("[WARN] [exchange] serno 43 timed out") != std::string::npos);

    reset_logger();
    fs::remove(log_file);
}

TEST_CASE("Logger at level off writes nothing")
{
    const std::string log_file = "/tmp/test_sigma_logger_off.log";
    fs::remove(log_file);

    REQUIRE(Logger::init({.level = Logger::Level::Off, .file = log_file, .max_size_mb = 1, .enable_console = false}));
    SIGMA_LOG_ERROR("schema", "table rejected");
    Logger::shutdown();

    CHECK(read_file(log_file).empty());

    reset_logger();
    fs::remove(log_file);
}

TEST_CASE("Logger rotates the file once it reaches its size limit")
{
    const std::string log_file = "/tmp/test_sigma_logger_rotate.log";
    fs::remove(log_file);
    fs::remove(log_file + ".1");

    REQUIRE(Logger::init({.level = Logger::Level::Info, .file = log_file, .max_size_mb = 1, .enable_console = false}));
    const std::string filler(1000, 'x');
    for (int i = 0; i < 1100; ++i)
    {
        SIGMA_LOG_INFO("test", "{}", filler);
    }
    Logger::shutdown();

    CHECK(fs::exists(log_file + ".1"));
    CHECK(fs::file_size(log_file + ".1") <= 1024 * 1024);
    CHECK(fs::file_size(log_file) < 1024 * 1024);

    reset_logger();
    fs::remove(log_file);
    fs::remove(log_file + ".1");
}

TEST_CASE("Logger::init reports an unwritable file")
{
    auto result = Logger::init({.level = Logger::Level::Info, .file = "/nonexistent/dir/sigma.log",
                                .max_size_mb = 1, .enable_console = false});

    CHECK(!result.has_value());
    reset_logger();
}
