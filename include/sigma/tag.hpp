#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "sigma/errors.hpp"
#include "sigma/field.hpp"

namespace sigma
{

// Wire byte that opens a tagged field
enum class TagClass : char
{
    regular = 'T',       // T0000..T9999
    iso = 'I',           // i000..i999
    iso_subfield = 'S'   // s000.00..s999.99
};

/*
 *  Tagged field on the wire:
 *
 *  | cls | num hi | num lo | sub | len hi | len lo | data ...
 *  |     |__ BCD number ___| BCD |___ BCD length __|
 */
struct Tag
{
    TagClass cls = TagClass::regular;
    uint16_t number = 0;
    uint8_t sub = 0;

    static constexpr size_t header_size = 4;
    static constexpr size_t length_size = 2;
    static constexpr size_t max_data_len = 9999;

    [[nodiscard]] static std::optional<Tag> parse(std::string_view name);
    [[nodiscard]] std::string name() const;
    [[nodiscard]] bool valid() const;

    auto operator<=>(const Tag&) const = default;
};

constexpr Tag regular_tag(uint16_t number) { return Tag{TagClass::regular, number, 0}; }
constexpr Tag iso_tag(uint16_t number) { return Tag{TagClass::iso, number, 0}; }
constexpr Tag iso_subfield_tag(uint16_t number, uint8_t sub) { return Tag{TagClass::iso_subfield, number, sub}; }

// Class, number and subfield only; the caller appends the length and data
void encode_tag(const Tag& tag, WireBuffer& out);

[[nodiscard]] std::expected<std::pair<Tag, size_t>, DecodingError> decode_tag(std::span<const std::byte> data,
                                                                              size_t cursor);

} // namespace sigma
