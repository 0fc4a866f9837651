#include "sigma/field.hpp"
#include "fundamentals/bytes.hpp"

#include <algorithm>
#include <string_view>

namespace sigma
{

bool in_charset(char ch, Charset cs)
{
    switch (cs)
    {
        case Charset::printable: return ch >= 0x20 && ch <= 0x7E;
        case Charset::digits:    return bytes::is_digit(ch);
        case Charset::any:       return true;
    }
    return false;
}

std::expected<void, EncodingError> check_field(const FieldValue& value, const FieldSpec& spec)
{
    auto fail = [&spec](EncodingError::errc ec)
    {
        return std::unexpected(EncodingError{ec, spec.name});
    };

    if (spec.encoding == Encoding::numeric)
    {
        const auto* num = std::get_if<uint64_t>(&value);
        if (!num)
        {
            return fail(EncodingError::errc::type_mismatch);
        }
        if (std::to_string(*num).size() > spec.width)
        {
            return fail(EncodingError::errc::value_out_of_range);
        }
        return {};
    }

    const auto* text = std::get_if<std::string>(&value);
    if (!text)
    {
        return fail(EncodingError::errc::type_mismatch);
    }
    if (text->size() != spec.width)
    {
        return fail(EncodingError::errc::length_mismatch);
    }
    if (!std::ranges::all_of(*text, [&spec](char ch){ return in_charset(ch, spec.charset); }))
    {
        return fail(EncodingError::errc::invalid_character);
    }
    return {};
}

std::expected<void, EncodingError> encode_field(const FieldValue& value, const FieldSpec& spec, WireBuffer& out)
{
    if (auto ok = check_field(value, spec); !ok)
    {
        return std::unexpected(ok.error());
    }

    if (spec.encoding == Encoding::numeric)
    {
        auto digits = std::to_string(std::get<uint64_t>(value));
        bytes::append(out, std::string(spec.width - digits.size(), '0'));
        bytes::append(out, digits);
    }
    else
    {
        bytes::append(out, std::get<std::string>(value));
    }
    return {};
}

std::expected<std::pair<FieldValue, size_t>, DecodingError> decode_field(std::span<const std::byte> data,
                                                                         const FieldSpec& spec,
                                                                         size_t cursor)
{
    if (cursor > data.size() || data.size() - cursor < spec.width)
    {
        return std::unexpected(DecodingError{DecodingError::errc::unexpected_end, spec.name, cursor});
    }

    std::string raw = bytes::to_string(data.subspan(cursor, spec.width));
    auto invalid = std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, spec.name, cursor});

    if (spec.encoding == Encoding::numeric)
    {
        // Switches space-pad short serial numbers instead of zero-padding them
        std::string_view sv = raw;
        sv.remove_prefix(std::min(sv.find_first_not_of(' '), sv.size()));
        sv.remove_suffix(sv.size() - std::min(sv.find_last_not_of(' ') + 1, sv.size()));

        auto num = bytes::parse_digits<uint64_t>(sv);
        if (!num)
        {
            return invalid;
        }
        return std::pair<FieldValue, size_t>{*num, cursor + spec.width};
    }

    if (!std::ranges::all_of(raw, [&spec](char ch){ return in_charset(ch, spec.charset); }))
    {
        return invalid;
    }
    return std::pair<FieldValue, size_t>{std::move(raw), cursor + spec.width};
}

} // namespace sigma
