#include "sigma/exchange.hpp"
#include "sigma/codec.hpp"
#include "logger.hpp"

#include <format>

namespace sigma
{

namespace {

std::string_view to_string(TransportError::errc ec)
{
    switch (ec)
    {
        case TransportError::errc::unavailable: return "unavailable";
        case TransportError::errc::timeout:     return "timeout";
        case TransportError::errc::io_failure:  return "I/O failure";
    }
    return "transport error";
}

ExchangeError widen(const EncodeError& err)
{
    return std::visit([](const auto& e) -> ExchangeError { return e; }, err);
}

} // namespace

std::string TransportError::message() const
{
    return detail.empty() ? std::format("transport {}", to_string(code))
                          : std::format("transport {}: {}", to_string(code), detail);
}

std::string PairingError::message() const
{
    return std::format("response serno {} does not answer request serno {}", actual_serno, expected_serno);
}

std::string describe(const ExchangeError& err)
{
    return std::visit([](const auto& e){ return e.message(); }, err);
}

std::expected<SigmaResponse, ExchangeError> exchange(Transport& transport,
                                                     const SigmaRequest& req,
                                                     const ExchangeOptions& opts)
{
    const Schema& req_schema = opts.request_schema ? *opts.request_schema : Schema::describe(MessageKind::request);
    const Schema& resp_schema = opts.response_schema ? *opts.response_schema : Schema::describe(MessageKind::response);

    // Pairing needs the serial even when the request schema does not carry it
    const auto serno = req.auth_serno();
    if (!serno)
    {
        return std::unexpected(ExchangeError{SchemaError{SchemaError::errc::missing_field, std::string(field_names::serno)}});
    }

    auto wire = codec::encode(req, req_schema);
    if (!wire)
    {
        return std::unexpected(widen(wire.error()));
    }

    auto reply = transport.round_trip(*wire);
    if (!reply)
    {
        SIGMA_LOG_WARN("exchange", "Exchange for serno {} failed: {}", *serno, reply.error().message());
        return std::unexpected(ExchangeError{reply.error()});
    }

    auto resp = codec::decode_response(*reply, resp_schema);
    if (!resp)
    {
        SIGMA_LOG_WARN("exchange", "Undecodable reply for serno {}: {}", *serno, resp.error().message());
        return std::unexpected(ExchangeError{resp.error()});
    }

    if (resp->auth_serno() != *serno)
    {
        SIGMA_LOG_WARN("exchange", "Reply serno {} does not match request serno {}", resp->auth_serno(), *serno);
        return std::unexpected(ExchangeError{PairingError{*serno, resp->auth_serno()}});
    }

    SIGMA_LOG_DEBUG("exchange", "Exchange for serno {} completed, mti {}", resp->auth_serno(), resp->mti());
    return std::move(*resp);
}

} // namespace sigma
