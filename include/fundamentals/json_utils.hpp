#pragma once
#include <boost/json.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <optional>
#include <cstdint>

#include "fundamentals/bytes.hpp"

namespace json_utils
{

enum class lookup_err
{
    missing,
    wrong_type
};

inline std::expected<std::string, lookup_err> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(lookup_err::missing);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(lookup_err::wrong_type);
    }

    return static_cast<std::string>(it->value().as_string());
}

// Non-negative integer, or a string holding only decimal digits
inline std::optional<uint64_t> as_uint(const boost::json::value& v)
{
    if (v.is_uint64())
    {
        return v.get_uint64();
    }
    if (v.is_int64() && v.get_int64() >= 0)
    {
        return static_cast<uint64_t>(v.get_int64());
    }
    if (v.is_string())
    {
        const auto& s = v.get_string();
        return bytes::parse_digits<uint64_t>(std::string_view(s.data(), s.size()));
    }
    return std::nullopt;
}

// String as-is, or an unsigned integer rendered in decimal
inline std::optional<std::string> as_text(const boost::json::value& v)
{
    if (v.is_string())
    {
        return static_cast<std::string>(v.get_string());
    }
    if (v.is_uint64())
    {
        return std::to_string(v.get_uint64());
    }
    if (v.is_int64() && v.get_int64() >= 0)
    {
        return std::to_string(v.get_int64());
    }
    return std::nullopt;
}

} // namespace json_utils
