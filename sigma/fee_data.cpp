#include "sigma/fee_data.hpp"
#include "fundamentals/bytes.hpp"

#include <format>

namespace sigma
{

std::expected<FeeData, DecodingError> FeeData::parse(std::string_view data)
{
    constexpr size_t amount_at = reason_digits + currency_digits;

    if (data.size() <= amount_at)
    {
        return std::unexpected(DecodingError{DecodingError::errc::unexpected_end, "fee", data.size()});
    }

    auto reason = bytes::parse_digits<uint16_t>(data.substr(0, reason_digits));
    if (!reason)
    {
        return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, "fee.reason", 0});
    }
    auto currency = bytes::parse_digits<uint16_t>(data.substr(reason_digits, currency_digits));
    if (!currency)
    {
        return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, "fee.currency", reason_digits});
    }
    auto amount = bytes::parse_digits<uint64_t>(data.substr(amount_at));
    if (!amount)
    {
        return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, "fee.amount", amount_at});
    }

    return FeeData{*reason, *currency, *amount};
}

std::expected<std::string, EncodingError> FeeData::format() const
{
    if (reason > 9999)
    {
        return std::unexpected(EncodingError{EncodingError::errc::value_out_of_range, "fee.reason"});
    }
    if (currency > 999)
    {
        return std::unexpected(EncodingError{EncodingError::errc::value_out_of_range, "fee.currency"});
    }
    return std::format("{:04}{:03}{}", reason, currency, amount);
}

} // namespace sigma
