#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace sigma
{

// Caller-supplied message is incomplete or violates its schema
struct SchemaError
{
    enum class errc
    {
        missing_field = 1,
        invalid_value = 2,
        unknown_field = 3
    };

    errc code;
    std::string field;

    [[nodiscard]] std::string message() const;
    bool operator==(const SchemaError&) const = default;
};

// A value has no representation in its wire form
struct EncodingError
{
    enum class errc
    {
        value_out_of_range = 1,
        length_mismatch = 2,
        type_mismatch = 3,
        invalid_character = 4
    };

    errc code;
    std::string field;

    [[nodiscard]] std::string message() const;
    bool operator==(const EncodingError&) const = default;
};

// Malformed or truncated input bytes
struct DecodingError
{
    enum class errc
    {
        unexpected_end = 1,
        invalid_encoding = 2,
        length_mismatch = 3,
        checksum_mismatch = 4
    };

    errc code;
    std::string field;
    size_t offset = 0;

    [[nodiscard]] std::string message() const;
    bool operator==(const DecodingError&) const = default;
};

// Validation runs ahead of encoding, so encode reports either kind
using EncodeError = std::variant<SchemaError, EncodingError>;

[[nodiscard]] std::string describe(const EncodeError& err);

std::string_view to_string(SchemaError::errc ec);
std::string_view to_string(EncodingError::errc ec);
std::string_view to_string(DecodingError::errc ec);

// Thrown when a schema table is malformed. This is a programming defect and
// never travels through the std::expected channels above.
class SchemaDefect : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace sigma
