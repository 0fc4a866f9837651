#include <catch2/catch_test_macros.hpp>

#include "sigma/exchange.hpp"
#include "sigma/codec.hpp"
#include "fundamentals/bytes.hpp"

#include <functional>
#include <string_view>

using namespace sigma;
using namespace std::literals;

namespace {

// Records what was sent and answers with whatever the test scripted
class MockTransport : public Transport
{
public:
    using Responder = std::function<std::expected<WireBuffer, TransportError>(std::span<const std::byte>)>;

    explicit MockTransport(Responder responder)
        : responder_(std::move(responder))
    {
    }

    std::expected<WireBuffer, TransportError> round_trip(std::span<const std::byte> request) override
    {
        ++calls;
        sent.assign(request.begin(), request.end());
        return responder_(request);
    }

    int calls = 0;
    WireBuffer sent;

private:
    Responder responder_;
};

SigmaRequest payment(uint64_t serno)
{
    SigmaRequest req;
    req.set_saf("Y").set_source("M").set_mti("0200").set_auth_serno(serno)
       .set_tag(3, "100.00")
       .set_tag(4, "USD");
    return req;
}

// Answers every request with an approval for the serial it carried
MockTransport::Responder echo_approval(uint32_t reason)
{
    return [reason](std::span<const std::byte> request) -> std::expected<WireBuffer, TransportError>
    {
        auto decoded = codec::decode_request(request);
        if (!decoded)
        {
            return std::unexpected(TransportError{TransportError::errc::io_failure, decoded.error().message()});
        }
        SigmaResponse resp("0210", *decoded->auth_serno());
        resp.set_reason(reason);
        auto wire = codec::encode(resp);
        if (!wire)
        {
            return std::unexpected(TransportError{TransportError::errc::io_failure, describe(wire.error())});
        }
        return std::move(*wire);
    };
}

} // namespace

TEST_CASE("exchange returns the paired response")
{
    MockTransport transport(echo_approval(8100));
    auto req = payment(42);

    auto resp = exchange(transport, req);

    REQUIRE(resp.has_value());
    CHECK(resp->mti() == "0210");
    CHECK(resp->auth_serno() == 42u);
    CHECK(resp->reason() == 8100u);

    auto expected_wire = codec::encode(req);
    REQUIRE(expected_wire.has_value());
    CHECK(transport.calls == 1);
    CHECK(transport.sent == *expected_wire);
}

TEST_CASE("exchange uses the schemas it is given")
{
    const Schema req_crc = Schema::describe(MessageKind::request).with_checksum(Checksum::crc32);
    const Schema resp_crc = Schema::describe(MessageKind::response).with_checksum(Checksum::crc32);

    MockTransport transport([&](std::span<const std::byte> request) -> std::expected<WireBuffer, TransportError>
    {
        auto decoded = codec::decode_request(request, req_crc);
        if (!decoded)
        {
            return std::unexpected(TransportError{TransportError::errc::io_failure, decoded.error().message()});
        }
        auto wire = codec::encode(SigmaResponse("0210", *decoded->auth_serno()), resp_crc);
        if (!wire)
        {
            return std::unexpected(TransportError{TransportError::errc::io_failure, describe(wire.error())});
        }
        return std::move(*wire);
    });

    auto resp = exchange(transport, payment(77), {.request_schema = &req_crc, .response_schema = &resp_crc});

    REQUIRE(resp.has_value());
    CHECK(resp->auth_serno() == 77u);
}

TEST_CASE("exchange does not send an invalid request")
{
    MockTransport transport(echo_approval(8100));
    auto req = payment(42);
    req.set_mti("02");

    auto resp = exchange(transport, req);

    REQUIRE(!resp);
    REQUIRE(std::holds_alternative<SchemaError>(resp.error()));
    CHECK(std::get<SchemaError>(resp.error()).field == "MTI");
    CHECK(transport.calls == 0);
}

TEST_CASE("exchange requires a serial even when the request schema has none")
{
    const Schema no_serno = Schema::build({
        .kind = MessageKind::request,
        .name = "NoSerno",
        .framing = {},
        .header = {
            {"SAF", Encoding::text, 1, Charset::printable},
            {"SRC", Encoding::text, 1, Charset::printable},
            {"MTI", Encoding::text, 4, Charset::digits},
        },
        .tags = {},
        .policy = TagPolicy::open
    });

    MockTransport transport([](std::span<const std::byte>) -> std::expected<WireBuffer, TransportError>
    {
        return bytes::to_bytes("0002401104007040978T\x00" "1\x00\x00\x04" "8495"sv);
    });

    SigmaRequest req;
    req.set_saf("Y").set_source("M").set_mti("0200");

    auto resp = exchange(transport, req, {.request_schema = &no_serno});

    REQUIRE(!resp);
    REQUIRE(std::holds_alternative<SchemaError>(resp.error()));
    CHECK(std::get<SchemaError>(resp.error()) == SchemaError{SchemaError::errc::missing_field, "Serno"});
    CHECK(transport.calls == 0);
}

TEST_CASE("exchange reports transport failures")
{
    MockTransport transport([](std::span<const std::byte>) -> std::expected<WireBuffer, TransportError>
    {
        return std::unexpected(TransportError{TransportError::errc::timeout, "no reply in 30s"});
    });

    auto resp = exchange(transport, payment(42));

    REQUIRE(!resp);
    REQUIRE(std::holds_alternative<TransportError>(resp.error()));
    CHECK(std::get<TransportError>(resp.error()).code == TransportError::errc::timeout);
    CHECK(describe(resp.error()) == "transport timeout: no reply in 30s");
}

TEST_CASE("exchange reports an undecodable reply")
{
    MockTransport transport([](std::span<const std::byte>) -> std::expected<WireBuffer, TransportError>
    {
        return bytes::to_bytes("0002401104007040978T\x00" "1\x00\x00\x04" "ABCD"sv);
    });

    auto resp = exchange(transport, payment(4007040978));

    REQUIRE(!resp);
    REQUIRE(std::holds_alternative<DecodingError>(resp.error()));
    CHECK(std::get<DecodingError>(resp.error()).code == DecodingError::errc::invalid_encoding);
}

TEST_CASE("exchange rejects a reply for another authorization")
{
    MockTransport transport([](std::span<const std::byte>) -> std::expected<WireBuffer, TransportError>
    {
        return bytes::to_bytes("0002401104007040978T\x00" "1\x00\x00\x04" "8495"sv);
    });

    auto resp = exchange(transport, payment(42));

    REQUIRE(!resp);
    REQUIRE(std::holds_alternative<PairingError>(resp.error()));
    CHECK(std::get<PairingError>(resp.error()) == PairingError{42, 4007040978});
}
