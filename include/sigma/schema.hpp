#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "sigma/errors.hpp"
#include "sigma/field.hpp"
#include "sigma/message.hpp"
#include "sigma/tag.hpp"

namespace sigma
{

enum class MessageKind : uint8_t
{
    request,
    response
};

enum class Checksum : uint8_t
{
    none,
    crc32   // 4 bytes big-endian over length prefix and body
};

enum class TagPolicy : uint8_t
{
    open,        // any valid tag, value is opaque text
    known_only   // tags from the table; unknown tags are skipped on decode
};

enum class TagValue : uint8_t
{
    text,
    numeric,  // ASCII decimal that fits uint32_t
    fee       // FeeData record
};

struct TagSpec
{
    Tag tag;
    std::string name;
    TagValue value = TagValue::text;
    bool repeatable = false;
};

struct Framing
{
    size_t length_digits = 5;
    Checksum checksum = Checksum::none;
};

struct SchemaDef
{
    MessageKind kind = MessageKind::request;
    std::string name;
    Framing framing;
    std::vector<FieldSpec> header;
    std::vector<TagSpec> tags;
    TagPolicy policy = TagPolicy::open;
};

/**
 * Immutable layout of one message kind.
 * The stock schemas are built on first use of describe() and live for the
 * whole process; build() throws SchemaDefect on a malformed table.
 */
class Schema
{
public:
    [[nodiscard]] static Schema build(SchemaDef def);
    [[nodiscard]] static const Schema& describe(MessageKind kind);

    [[nodiscard]] Schema with_checksum(Checksum checksum) const;

    [[nodiscard]] std::expected<void, SchemaError> validate(const Message& msg) const;

    [[nodiscard]] MessageKind kind() const { return def.kind; }
    [[nodiscard]] const std::string& name() const { return def.name; }
    [[nodiscard]] const Framing& framing() const { return def.framing; }
    [[nodiscard]] const std::vector<FieldSpec>& header() const { return def.header; }
    [[nodiscard]] const std::vector<TagSpec>& tags() const { return def.tags; }
    [[nodiscard]] TagPolicy policy() const { return def.policy; }

    [[nodiscard]] const TagSpec* find_tag(const Tag& tag) const;
    [[nodiscard]] size_t trailer_size() const;
    [[nodiscard]] size_t max_body_size() const;

private:
    explicit Schema(SchemaDef d);

    SchemaDef def;
};

[[nodiscard]] std::expected<void, SchemaError> validate(const Message& msg, const Schema& schema);

// Whether `data` is a well-formed value for the typed tag
[[nodiscard]] bool tag_data_valid(const TagSpec& spec, std::string_view data);

// Header field names shared by the stock schemas
namespace field_names
{
    constexpr std::string_view saf = "SAF";
    constexpr std::string_view source = "SRC";
    constexpr std::string_view mti = "MTI";
    constexpr std::string_view serno = "Serno";
}

// Typed response tags
namespace response_tags
{
    constexpr Tag reason = regular_tag(31);
    constexpr Tag fee = regular_tag(32);
    constexpr Tag adata = regular_tag(48);
}

} // namespace sigma
