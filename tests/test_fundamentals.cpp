#include <catch2/catch_test_macros.hpp>

#include "fundamentals/bytes.hpp"

#include <vector>
#include <cstddef>

using namespace bytes;

TEST_CASE("bytes::to_bytes converts string_view correctly")
{
    auto result = to_bytes("hello");

    REQUIRE(result.size() == 5);
    CHECK(result[0] == std::byte{0x68});
    CHECK(result[1] == std::byte{0x65});
    CHECK(result[2] == std::byte{0x6C});
    CHECK(result[3] == std::byte{0x6C});
    CHECK(result[4] == std::byte{0x6F});
}

TEST_CASE("bytes::to_string is the inverse of to_bytes")
{
    CHECK(bytes::to_string(to_bytes("YM0200")) == "YM0200");
}

TEST_CASE("bytes::to_int reads big-endian")
{
    std::vector<std::byte> data
    {
        std::byte{0x00}, std::byte{0x00}, std::byte{0x01}, std::byte{0x02}
    };

    uint32_t result = to_int(std::span{data});

    CHECK(result == 0x0102);
}

TEST_CASE("bytes::append_int writes big-endian")
{
    std::vector<std::byte> out;
    append_int<uint32_t>(out, 0xCAFEBABE);

    REQUIRE(out.size() == 4);
    CHECK(out[0] == std::byte{0xCA});
    CHECK(out[3] == std::byte{0xBE});
    CHECK(to_int<uint32_t>(out) == 0xCAFEBABE);
}

TEST_CASE("bytes::append_bcd packs two digits per byte")
{
    std::vector<std::byte> out;
    append_bcd(out, 105, 2);

    REQUIRE(out.size() == 2);
    CHECK(out[0] == std::byte{0x01});
    CHECK(out[1] == std::byte{0x05});

    out.clear();
    append_bcd(out, 38, 2);
    CHECK(out[0] == std::byte{0x00});
    CHECK(out[1] == std::byte{0x38});
}

TEST_CASE("bytes::decode_bcd rejects nibbles above nine")
{
    std::vector<std::byte> good{std::byte{0x99}, std::byte{0x99}};
    std::vector<std::byte> bad{std::byte{0x00}, std::byte{0x3A}};

    CHECK(decode_bcd(good) == 9999u);
    CHECK_FALSE(decode_bcd(bad).has_value());
}

TEST_CASE("bytes::parse_digits accepts only plain decimal")
{
    CHECK(parse_digits<uint64_t>("0600704097") == 600704097u);
    CHECK_FALSE(parse_digits<uint64_t>("").has_value());
    CHECK_FALSE(parse_digits<uint64_t>("12a4").has_value());
    CHECK_FALSE(parse_digits<uint64_t>("-12").has_value());
    CHECK_FALSE(parse_digits<uint16_t>("70000").has_value());
}
