#include "sigma/codec.hpp"
#include "fundamentals/bytes.hpp"

#include <boost/crc.hpp>
#include <format>
#include <set>

namespace sigma::codec
{

namespace {

std::unexpected<DecodingError> fail(DecodingError::errc ec, std::string_view field, size_t offset)
{
    return std::unexpected(DecodingError{ec, std::string(field), offset});
}

void append_tagged(const TaggedValue& tv, WireBuffer& out)
{
    encode_tag(tv.tag, out);
    bytes::append_bcd(out, static_cast<uint32_t>(tv.data.size()), Tag::length_size);
    bytes::append(out, tv.data);
}

} // namespace

uint32_t checksum(std::span<const std::byte> data)
{
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

std::expected<WireBuffer, EncodeError> encode(const Message& msg, const Schema& schema)
{
    if (auto ok = schema.validate(msg); !ok)
    {
        return std::unexpected(ok.error());
    }

    WireBuffer body;
    for (const auto& spec : schema.header())
    {
        if (auto ok = encode_field(msg.fields.find(spec.name)->second, spec, body); !ok)
        {
            return std::unexpected(ok.error());
        }
    }
    for (const auto& tv : msg.tagged)
    {
        append_tagged(tv, body);
    }

    const size_t digits = schema.framing().length_digits;
    const size_t declared = body.size() + schema.trailer_size();
    if (declared > schema.max_body_size())
    {
        return std::unexpected(EncodingError{EncodingError::errc::value_out_of_range, "length"});
    }

    WireBuffer out;
    out.reserve(digits + declared);
    bytes::append(out, std::format("{:0{}}", declared, digits));
    out.insert(out.end(), body.begin(), body.end());

    if (schema.framing().checksum == Checksum::crc32)
    {
        bytes::append_int(out, checksum(out));
    }
    return out;
}

std::expected<Message, DecodingError> decode(std::span<const std::byte> data, const Schema& schema)
{
    const size_t digits = schema.framing().length_digits;
    if (data.size() < digits)
    {
        return fail(DecodingError::errc::unexpected_end, "length", data.size());
    }

    auto declared = bytes::parse_digits<size_t>(bytes::to_string(data.first(digits)));
    if (!declared)
    {
        return fail(DecodingError::errc::invalid_encoding, "length", 0);
    }

    // Never trust the prefix beyond what was actually received
    const size_t remaining = data.size() - digits;
    if (remaining < *declared)
    {
        return fail(DecodingError::errc::unexpected_end, "length", data.size());
    }
    if (remaining > *declared)
    {
        return fail(DecodingError::errc::length_mismatch, "length", digits + *declared);
    }

    const size_t trailer = schema.trailer_size();
    if (*declared < trailer)
    {
        return fail(DecodingError::errc::length_mismatch, "checksum", digits);
    }
    if (schema.framing().checksum == Checksum::crc32)
    {
        const size_t at = data.size() - trailer;
        if (checksum(data.first(at)) != bytes::to_int<uint32_t>(data.subspan(at)))
        {
            return fail(DecodingError::errc::checksum_mismatch, "checksum", at);
        }
    }

    auto content = data.first(data.size() - trailer);
    size_t cursor = digits;
    Message msg;
    std::set<Tag> seen;

    for (const auto& spec : schema.header())
    {
        auto field = decode_field(content, spec, cursor);
        if (!field)
        {
            return std::unexpected(field.error());
        }
        msg.fields.emplace(spec.name, std::move(field->first));
        cursor = field->second;
    }

    while (cursor < content.size())
    {
        auto tag = decode_tag(content, cursor);
        if (!tag)
        {
            return std::unexpected(tag.error());
        }
        const auto [tg, len_at] = *tag;

        if (content.size() - len_at < Tag::length_size)
        {
            return fail(DecodingError::errc::unexpected_end, tg.name(), len_at);
        }
        auto len = bytes::decode_bcd(content.subspan(len_at, Tag::length_size));
        if (!len)
        {
            return fail(DecodingError::errc::invalid_encoding, tg.name(), len_at);
        }

        const size_t data_at = len_at + Tag::length_size;
        if (content.size() - data_at < *len)
        {
            return fail(DecodingError::errc::unexpected_end, tg.name(), data_at);
        }
        cursor = data_at + *len;

        std::string value = bytes::to_string(content.subspan(data_at, *len));
        if (schema.policy() == TagPolicy::known_only)
        {
            const TagSpec* spec = schema.find_tag(tg);
            if (!spec)
            {
                continue;
            }
            if (!tag_data_valid(*spec, value) || (!seen.insert(tg).second && !spec->repeatable))
            {
                return fail(DecodingError::errc::invalid_encoding, spec->name, data_at);
            }
        }
        msg.tagged.push_back({tg, std::move(value)});
    }
    return msg;
}

std::expected<WireBuffer, EncodeError> encode(const SigmaRequest& req, const Schema& schema)
{
    return encode(req.to_message(), schema);
}

std::expected<WireBuffer, EncodeError> encode(const SigmaResponse& resp, const Schema& schema)
{
    auto msg = resp.to_message();
    if (!msg)
    {
        return std::unexpected(msg.error());
    }
    return encode(*msg, schema);
}

std::expected<SigmaRequest, DecodingError> decode_request(std::span<const std::byte> data, const Schema& schema)
{
    return decode(data, schema).transform(&SigmaRequest::from_message);
}

std::expected<SigmaResponse, DecodingError> decode_response(std::span<const std::byte> data, const Schema& schema)
{
    return decode(data, schema).and_then(&SigmaResponse::from_message);
}

} // namespace sigma::codec
