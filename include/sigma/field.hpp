#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "sigma/errors.hpp"

namespace sigma
{

using WireBuffer = std::vector<std::byte>;

// Text or numeric value of a header field
using FieldValue = std::variant<std::string, uint64_t>;

enum class Encoding : uint8_t
{
    numeric,  // ASCII decimal, zero padded to the field width
    text      // exactly `width` bytes, checked against the charset
};

enum class Charset : uint8_t
{
    any,
    printable,  // 0x20..0x7E
    digits
};

struct FieldSpec
{
    std::string name;
    Encoding encoding = Encoding::text;
    size_t width = 0;
    Charset charset = Charset::any;
};

// Largest width a numeric field may declare and still fit in uint64_t
constexpr size_t max_numeric_width = 19;

[[nodiscard]] std::expected<void, EncodingError> check_field(const FieldValue& value, const FieldSpec& spec);

// Appends exactly spec.width bytes on success; `out` is left untouched on failure
[[nodiscard]] std::expected<void, EncodingError> encode_field(const FieldValue& value,
                                                              const FieldSpec& spec,
                                                              WireBuffer& out);

// Reads the field starting at `cursor` and returns the value with the advanced cursor
[[nodiscard]] std::expected<std::pair<FieldValue, size_t>, DecodingError> decode_field(std::span<const std::byte> data,
                                                                                       const FieldSpec& spec,
                                                                                       size_t cursor);

bool in_charset(char ch, Charset cs);

} // namespace sigma
