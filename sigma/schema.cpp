#include "sigma/schema.hpp"
#include "sigma/fee_data.hpp"
#include "fundamentals/bytes.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <set>

namespace sigma
{

namespace {

constexpr size_t max_length_digits = 9;

SchemaDef request_def()
{
    return SchemaDef{
        .kind = MessageKind::request,
        .name = "SigmaRequest",
        .framing = {},
        .header = {
            {std::string(field_names::saf), Encoding::text, 1, Charset::printable},
            {std::string(field_names::source), Encoding::text, 1, Charset::printable},
            {std::string(field_names::mti), Encoding::text, 4, Charset::digits},
            {std::string(field_names::serno), Encoding::numeric, 10, Charset::digits},
        },
        .tags = {},
        .policy = TagPolicy::open
    };
}

SchemaDef response_def()
{
    return SchemaDef{
        .kind = MessageKind::response,
        .name = "SigmaResponse",
        .framing = {},
        .header = {
            {std::string(field_names::mti), Encoding::text, 4, Charset::digits},
            {std::string(field_names::serno), Encoding::numeric, 10, Charset::digits},
        },
        .tags = {
            {response_tags::reason, "reason", TagValue::numeric, false},
            {response_tags::fee, "fee", TagValue::fee, true},
            {response_tags::adata, "adata", TagValue::text, false},
        },
        .policy = TagPolicy::known_only
    };
}

std::expected<void, std::string> check_def(const SchemaDef& def)
{
    if (def.name.empty())
    {
        return std::unexpected("schema has no name");
    }
    if (def.framing.length_digits == 0 || def.framing.length_digits > max_length_digits)
    {
        return std::unexpected(std::format("length prefix must have 1..{} digits", max_length_digits));
    }

    std::set<std::string, std::less<>> names;
    for (const auto& f : def.header)
    {
        if (f.name.empty())
        {
            return std::unexpected("header field without a name");
        }
        if (!names.insert(f.name).second)
        {
            return std::unexpected(std::format("duplicate header field '{}'", f.name));
        }
        if (f.width == 0)
        {
            return std::unexpected(std::format("field '{}' has zero width", f.name));
        }
        if (f.encoding == Encoding::numeric && f.width > max_numeric_width)
        {
            return std::unexpected(std::format("numeric field '{}' wider than {} digits", f.name, max_numeric_width));
        }
    }

    std::set<Tag> tags;
    for (const auto& t : def.tags)
    {
        if (t.name.empty())
        {
            return std::unexpected(std::format("tag {} without a name", t.tag.name()));
        }
        if (!t.tag.valid())
        {
            return std::unexpected(std::format("tag {} out of range", t.tag.name()));
        }
        if (!tags.insert(t.tag).second)
        {
            return std::unexpected(std::format("duplicate tag {}", t.tag.name()));
        }
    }
    return {};
}

} // namespace

bool tag_data_valid(const TagSpec& spec, std::string_view data)
{
    switch (spec.value)
    {
        case TagValue::numeric: return bytes::parse_digits<uint32_t>(data).has_value();
        case TagValue::fee:     return FeeData::parse(data).has_value();
        case TagValue::text:    return true;
    }
    return false;
}

Schema::Schema(SchemaDef d)
    : def(std::move(d))
{
}

Schema Schema::build(SchemaDef def)
{
    if (auto ok = check_def(def); !ok)
    {
        SIGMA_LOG_ERROR("schema", "Schema '{}' rejected: {}", def.name, ok.error());
        throw SchemaDefect(std::format("schema '{}': {}", def.name, ok.error()));
    }
    return Schema(std::move(def));
}

const Schema& Schema::describe(MessageKind kind)
{
    static const Schema request = build(request_def());
    static const Schema response = build(response_def());

    return kind == MessageKind::request ? request : response;
}

Schema Schema::with_checksum(Checksum checksum) const
{
    SchemaDef copy = def;
    copy.framing.checksum = checksum;
    return build(std::move(copy));
}

const TagSpec* Schema::find_tag(const Tag& tag) const
{
    auto it = std::ranges::find(def.tags, tag, &TagSpec::tag);
    return it == def.tags.end() ? nullptr : std::addressof(*it);
}

size_t Schema::trailer_size() const
{
    return def.framing.checksum == Checksum::crc32 ? sizeof(uint32_t) : 0;
}

size_t Schema::max_body_size() const
{
    size_t max = 1;
    for (size_t i = 0; i < def.framing.length_digits; ++i)
    {
        max *= 10;
    }
    return max - 1;
}

std::expected<void, SchemaError> Schema::validate(const Message& msg) const
{
    for (const auto& [name, value] : msg.fields)
    {
        if (std::ranges::find(def.header, name, &FieldSpec::name) == def.header.end())
        {
            return std::unexpected(SchemaError{SchemaError::errc::unknown_field, name});
        }
    }

    for (const auto& spec : def.header)
    {
        auto it = msg.fields.find(spec.name);
        if (it == msg.fields.end())
        {
            return std::unexpected(SchemaError{SchemaError::errc::missing_field, spec.name});
        }
        if (!check_field(it->second, spec))
        {
            return std::unexpected(SchemaError{SchemaError::errc::invalid_value, spec.name});
        }
    }

    std::set<Tag> seen;
    for (const auto& tv : msg.tagged)
    {
        if (!tv.tag.valid() || tv.data.size() > Tag::max_data_len)
        {
            return std::unexpected(SchemaError{SchemaError::errc::invalid_value, tv.tag.name()});
        }
        if (def.policy == TagPolicy::open)
        {
            continue;
        }

        const TagSpec* spec = find_tag(tv.tag);
        if (!spec)
        {
            return std::unexpected(SchemaError{SchemaError::errc::unknown_field, tv.tag.name()});
        }
        if ((!seen.insert(tv.tag).second && !spec->repeatable) || !tag_data_valid(*spec, tv.data))
        {
            return std::unexpected(SchemaError{SchemaError::errc::invalid_value, spec->name});
        }
    }
    return {};
}

std::expected<void, SchemaError> validate(const Message& msg, const Schema& schema)
{
    return schema.validate(msg);
}

} // namespace sigma
