#include "sigma/response.hpp"
#include "sigma/schema.hpp"
#include "fundamentals/bytes.hpp"

namespace sigma
{

SigmaResponse::SigmaResponse(std::string_view mti, uint64_t auth_serno)
    : mti_(mti)
    , auth_serno_(auth_serno)
{
}

SigmaResponse& SigmaResponse::set_reason(uint32_t v)
{
    reason_ = v;
    return *this;
}

SigmaResponse& SigmaResponse::add_fee(const FeeData& fee)
{
    fees_.push_back(fee);
    return *this;
}

SigmaResponse& SigmaResponse::set_adata(std::string_view v)
{
    adata_ = std::string(v);
    return *this;
}

std::expected<Message, EncodingError> SigmaResponse::to_message() const
{
    Message msg;
    msg.fields.emplace(field_names::mti, mti_);
    msg.fields.emplace(field_names::serno, auth_serno_);

    if (reason_)
    {
        msg.tagged.push_back({response_tags::reason, std::to_string(*reason_)});
    }
    for (const auto& fee : fees_)
    {
        auto data = fee.format();
        if (!data)
        {
            return std::unexpected(data.error());
        }
        msg.tagged.push_back({response_tags::fee, std::move(*data)});
    }
    if (adata_)
    {
        msg.tagged.push_back({response_tags::adata, *adata_});
    }
    return msg;
}

std::expected<SigmaResponse, DecodingError> SigmaResponse::from_message(const Message& msg)
{
    auto mti = msg.fields.find(field_names::mti);
    auto serno = msg.fields.find(field_names::serno);
    if (mti == msg.fields.end() || !std::holds_alternative<std::string>(mti->second))
    {
        return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, std::string(field_names::mti), 0});
    }
    if (serno == msg.fields.end() || !std::holds_alternative<uint64_t>(serno->second))
    {
        return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, std::string(field_names::serno), 0});
    }

    SigmaResponse resp(std::get<std::string>(mti->second), std::get<uint64_t>(serno->second));

    for (const auto& tv : msg.tagged)
    {
        if (tv.tag == response_tags::reason)
        {
            auto reason = bytes::parse_digits<uint32_t>(tv.data);
            if (!reason)
            {
                return std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, "reason", 0});
            }
            resp.reason_ = *reason;
        }
        else if (tv.tag == response_tags::fee)
        {
            auto fee = FeeData::parse(tv.data);
            if (!fee)
            {
                return std::unexpected(fee.error());
            }
            resp.fees_.push_back(*fee);
        }
        else if (tv.tag == response_tags::adata)
        {
            resp.adata_ = tv.data;
        }
    }
    return resp;
}

} // namespace sigma
