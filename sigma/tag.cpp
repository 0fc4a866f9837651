#include "sigma/tag.hpp"
#include "fundamentals/bytes.hpp"

#include <format>

namespace sigma
{

std::optional<Tag> Tag::parse(std::string_view name)
{
    if (name.size() == 5 && name[0] == 'T')
    {
        if (auto num = bytes::parse_digits<uint16_t>(name.substr(1)))
        {
            return regular_tag(*num);
        }
    }
    else if (name.size() == 4 && name[0] == 'i')
    {
        if (auto num = bytes::parse_digits<uint16_t>(name.substr(1)))
        {
            return iso_tag(*num);
        }
    }
    else if (name.size() == 7 && name[0] == 's' && name[4] == '.')
    {
        auto num = bytes::parse_digits<uint16_t>(name.substr(1, 3));
        auto sub = bytes::parse_digits<uint8_t>(name.substr(5));
        if (num && sub)
        {
            return iso_subfield_tag(*num, *sub);
        }
    }
    return std::nullopt;
}

std::string Tag::name() const
{
    switch (cls)
    {
        case TagClass::regular:      return std::format("T{:04}", number);
        case TagClass::iso:          return std::format("i{:03}", number);
        case TagClass::iso_subfield: return std::format("s{:03}.{:02}", number, sub);
    }
    return std::format("?{}", number);
}

bool Tag::valid() const
{
    switch (cls)
    {
        case TagClass::regular:      return number <= 9999 && sub == 0;
        case TagClass::iso:          return number <= 999 && sub == 0;
        case TagClass::iso_subfield: return number <= 999 && sub <= 99;
    }
    return false;
}

void encode_tag(const Tag& tag, WireBuffer& out)
{
    out.push_back(bytes::int2byte(static_cast<uint8_t>(tag.cls)));
    bytes::append_bcd(out, tag.number, 2);
    bytes::append_bcd(out, tag.sub, 1);
}

std::expected<std::pair<Tag, size_t>, DecodingError> decode_tag(std::span<const std::byte> data, size_t cursor)
{
    if (cursor > data.size() || data.size() - cursor < Tag::header_size)
    {
        return std::unexpected(DecodingError{DecodingError::errc::unexpected_end, "tag", cursor});
    }

    auto invalid = std::unexpected(DecodingError{DecodingError::errc::invalid_encoding, "tag", cursor});

    Tag tag;
    switch (static_cast<char>(std::to_integer<uint8_t>(data[cursor])))
    {
        case 'T': tag.cls = TagClass::regular; break;
        case 'I': tag.cls = TagClass::iso; break;
        case 'S': tag.cls = TagClass::iso_subfield; break;
        default: return invalid;
    }

    auto number = bytes::decode_bcd(data.subspan(cursor + 1, 2));
    auto sub = bytes::decode_bcd(data.subspan(cursor + 3, 1));
    if (!number || !sub)
    {
        return invalid;
    }
    tag.number = static_cast<uint16_t>(*number);
    tag.sub = static_cast<uint8_t>(*sub);

    if (!tag.valid())
    {
        return invalid;
    }
    return std::pair{tag, cursor + Tag::header_size};
}

} // namespace sigma
