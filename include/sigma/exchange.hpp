#pragma once
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>

#include "sigma/errors.hpp"
#include "sigma/field.hpp"
#include "sigma/request.hpp"
#include "sigma/response.hpp"
#include "sigma/schema.hpp"

namespace sigma
{

// Failure reported by whatever carries bytes to and from the switch
struct TransportError
{
    enum class errc
    {
        unavailable = 1,
        timeout = 2,
        io_failure = 3
    };

    errc code;
    std::string detail;

    [[nodiscard]] std::string message() const;
    bool operator==(const TransportError&) const = default;
};

// Reply decoded fine but answers a different authorization
struct PairingError
{
    uint64_t expected_serno = 0;
    uint64_t actual_serno = 0;

    [[nodiscard]] std::string message() const;
    bool operator==(const PairingError&) const = default;
};

// Sends one encoded request and returns the raw reply. Framing beyond what the
// schema encodes is not assumed: the reply must carry its own length prefix.
class Transport
{
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::expected<WireBuffer, TransportError> round_trip(std::span<const std::byte> request) = 0;
};

// One alternative per layer; conversions into it are explicit
using ExchangeError = std::variant<SchemaError, EncodingError, TransportError, DecodingError, PairingError>;

[[nodiscard]] std::string describe(const ExchangeError& err);

struct ExchangeOptions
{
    const Schema* request_schema = nullptr;   // null: Schema::describe(request)
    const Schema* response_schema = nullptr;  // null: Schema::describe(response)
};

[[nodiscard]] std::expected<SigmaResponse, ExchangeError> exchange(Transport& transport,
                                                                   const SigmaRequest& req,
                                                                   const ExchangeOptions& opts = {});

} // namespace sigma
