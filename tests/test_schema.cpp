#include <catch2/catch_test_macros.hpp>

#include "sigma/schema.hpp"
#include "sigma/request.hpp"
#include "sigma/response.hpp"

using namespace sigma;

namespace {

SigmaRequest complete_request()
{
    SigmaRequest req;
    req.set_saf("Y").set_source("M").set_mti("0200").set_auth_serno(6007040979);
    return req;
}

}

TEST_CASE("describe returns the same immutable schema on every call")
{
    const Schema& a = Schema::describe(MessageKind::request);
    const Schema& b = Schema::describe(MessageKind::request);

    CHECK(&a == &b);
    CHECK(a.kind() == MessageKind::request);
    CHECK(a.name() == "SigmaRequest");
    REQUIRE(a.header().size() == 4);
    CHECK(a.header()[0].name == "SAF");
    CHECK(a.header()[3].name == "Serno");
    CHECK(a.framing().length_digits == 5);
    CHECK(a.framing().checksum == Checksum::none);
}

TEST_CASE("response schema knows its typed tags")
{
    const Schema& s = Schema::describe(MessageKind::response);

    CHECK(s.policy() == TagPolicy::known_only);
    REQUIRE(s.find_tag(response_tags::reason) != nullptr);
    CHECK(s.find_tag(response_tags::reason)->value == TagValue::numeric);
    CHECK(s.find_tag(response_tags::fee)->repeatable);
    CHECK(s.find_tag(regular_tag(99)) == nullptr);
}

TEST_CASE("validate accepts a complete request")
{
    auto result = validate(complete_request().to_message(), Schema::describe(MessageKind::request));

    CHECK(result.has_value());
}

TEST_CASE("validate reports each missing header field")
{
    const Schema& s = Schema::describe(MessageKind::request);

    SigmaRequest no_saf;
    no_saf.set_source("M").set_mti("0200").set_auth_serno(1);
    auto r1 = validate(no_saf.to_message(), s);
    REQUIRE(!r1);
    CHECK(r1.error() == SchemaError{SchemaError::errc::missing_field, "SAF"});

    SigmaRequest no_serno;
    no_serno.set_saf("N").set_source("O").set_mti("0200");
    auto r2 = validate(no_serno.to_message(), s);
    REQUIRE(!r2);
    CHECK(r2.error() == SchemaError{SchemaError::errc::missing_field, "Serno"});
}

TEST_CASE("validate rejects header values the wire cannot carry")
{
    const Schema& s = Schema::describe(MessageKind::request);

    auto long_serno = complete_request().set_auth_serno(7877706965687192023ull);
    auto r1 = validate(long_serno.to_message(), s);
    REQUIRE(!r1);
    CHECK(r1.error() == SchemaError{SchemaError::errc::invalid_value, "Serno"});

    auto bad_mti = complete_request().set_mti("12");
    auto r2 = validate(bad_mti.to_message(), s);
    REQUIRE(!r2);
    CHECK(r2.error() == SchemaError{SchemaError::errc::invalid_value, "MTI"});
}

TEST_CASE("validate rejects oversized tag data and unknown header names")
{
    const Schema& s = Schema::describe(MessageKind::request);

    auto oversized = complete_request().set_tag(14, std::string(10000, 'x'));
    auto r1 = validate(oversized.to_message(), s);
    REQUIRE(!r1);
    CHECK(r1.error() == SchemaError{SchemaError::errc::invalid_value, "T0014"});

    auto msg = complete_request().to_message();
    msg.fields.emplace("Extra", std::string("1"));
    auto r2 = validate(msg, s);
    REQUIRE(!r2);
    CHECK(r2.error().code == SchemaError::errc::unknown_field);
}

TEST_CASE("validate applies the response tag table")
{
    const Schema& s = Schema::describe(MessageKind::response);
    SigmaResponse resp("0110", 4007040978);

    auto ok = resp.to_message();
    REQUIRE(ok);
    CHECK(validate(*ok, s).has_value());

    auto unknown = *ok;
    unknown.tagged.push_back({regular_tag(5), "x"});
    CHECK(validate(unknown, s).error().code == SchemaError::errc::unknown_field);

    auto bad_reason = *ok;
    bad_reason.tagged.push_back({response_tags::reason, "ABCD"});
    CHECK(validate(bad_reason, s).error() == SchemaError{SchemaError::errc::invalid_value, "reason"});

    auto twice = *ok;
    twice.tagged.push_back({response_tags::adata, "a"});
    twice.tagged.push_back({response_tags::adata, "b"});
    CHECK(validate(twice, s).error() == SchemaError{SchemaError::errc::invalid_value, "adata"});

    auto fees = *ok;
    fees.tagged.push_back({response_tags::fee, "8116978300"});
    fees.tagged.push_back({response_tags::fee, "8116643100"});
    CHECK(validate(fees, s).has_value());
}

TEST_CASE("Schema::build throws SchemaDefect on a malformed table")
{
    SchemaDef dup{
        .kind = MessageKind::request,
        .name = "Broken",
        .framing = {},
        .header = {
            {"A", Encoding::text, 1, Charset::any},
            {"A", Encoding::text, 2, Charset::any},
        },
        .tags = {},
        .policy = TagPolicy::open
    };
    CHECK_THROWS_AS(Schema::build(dup), SchemaDefect);

    SchemaDef zero_width{.kind = MessageKind::request, .name = "Broken", .framing = {},
                         .header = {{"A", Encoding::numeric, 0, Charset::digits}}, .tags = {},
                         .policy = TagPolicy::open};
    CHECK_THROWS_AS(Schema::build(zero_width), SchemaDefect);

    SchemaDef bad_tag{.kind = MessageKind::response, .name = "Broken", .framing = {},
                      .header = {}, .tags = {{iso_tag(1000), "x", TagValue::text, false}},
                      .policy = TagPolicy::known_only};
    CHECK_THROWS_AS(Schema::build(bad_tag), SchemaDefect);

    SchemaDef bad_framing{.kind = MessageKind::request, .name = "Broken",
                          .framing = {.length_digits = 0, .checksum = Checksum::none},
                          .header = {}, .tags = {}, .policy = TagPolicy::open};
    CHECK_THROWS_AS(Schema::build(bad_framing), SchemaDefect);
}

TEST_CASE("with_checksum derives a new schema and leaves the stock one alone")
{
    const Schema& stock = Schema::describe(MessageKind::request);
    Schema crc = stock.with_checksum(Checksum::crc32);

    CHECK(crc.framing().checksum == Checksum::crc32);
    CHECK(crc.trailer_size() == 4);
    CHECK(crc.header().size() == stock.header().size());
    CHECK(stock.framing().checksum == Checksum::none);
    CHECK(stock.trailer_size() == 0);
}
