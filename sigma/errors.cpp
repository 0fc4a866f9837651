#include "sigma/errors.hpp"

#include <format>

namespace sigma
{

std::string_view to_string(SchemaError::errc ec)
{
    switch (ec)
    {
        case SchemaError::errc::missing_field: return "missing field";
        case SchemaError::errc::invalid_value: return "invalid value";
        case SchemaError::errc::unknown_field: return "unknown field";
    }
    return "schema error";
}

std::string_view to_string(EncodingError::errc ec)
{
    switch (ec)
    {
        case EncodingError::errc::value_out_of_range: return "value out of range";
        case EncodingError::errc::length_mismatch:    return "length mismatch";
        case EncodingError::errc::type_mismatch:      return "type mismatch";
        case EncodingError::errc::invalid_character:  return "invalid character";
    }
    return "encoding error";
}

std::string_view to_string(DecodingError::errc ec)
{
    switch (ec)
    {
        case DecodingError::errc::unexpected_end:    return "unexpected end of buffer";
        case DecodingError::errc::invalid_encoding:  return "invalid encoding";
        case DecodingError::errc::length_mismatch:   return "length mismatch";
        case DecodingError::errc::checksum_mismatch: return "checksum mismatch";
    }
    return "decoding error";
}

std::string SchemaError::message() const
{
    return std::format("{} '{}'", to_string(code), field);
}

std::string EncodingError::message() const
{
    return std::format("cannot encode '{}': {}", field, to_string(code));
}

std::string DecodingError::message() const
{
    return std::format("cannot decode '{}' at offset {}: {}", field, offset, to_string(code));
}

std::string describe(const EncodeError& err)
{
    return std::visit([](const auto& e){ return e.message(); }, err);
}

} // namespace sigma
