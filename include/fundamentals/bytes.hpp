#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <ranges>
#include <algorithm>
#include <iterator>

namespace bytes
{

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

// Big-endian read of sizeof(Ty) bytes; caller guarantees the span is long enough
template<std::integral Ty = uint32_t>
Ty to_int(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<std::integral From>
void append_int(std::vector<std::byte>& to, From val)
{
    val = endify(val);
    const auto* raw = reinterpret_cast<const std::byte*>(std::addressof(val));
    to.insert(to.end(), raw, raw + sizeof(From));
}

inline std::vector<std::byte> to_bytes(std::string_view sv)
{
    return sv |
        std::views::transform([](char ch){ return int2byte(static_cast<uint8_t>(ch)); }) |
        std::ranges::to<std::vector<std::byte>>();
}

inline void append(std::vector<std::byte>& to, std::string_view sv)
{
    std::ranges::transform(sv, std::back_inserter(to),
                           [](char ch){ return int2byte(static_cast<uint8_t>(ch)); });
}

inline std::string to_string(std::span<const std::byte> from)
{
    return from |
        std::views::transform([](std::byte b){ return static_cast<char>(std::to_integer<uint8_t>(b)); }) |
        std::ranges::to<std::string>();
}

constexpr bool is_digit(char ch)
{
    return ch >= '0' && ch <= '9';
}

// Parses a non-empty run of ASCII digits; nullopt on any other byte or overflow
template<std::unsigned_integral Ty = uint64_t>
std::optional<Ty> parse_digits(std::string_view sv)
{
    if (sv.empty() || !std::ranges::all_of(sv, is_digit))
    {
        return std::nullopt;
    }

    Ty ret = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), ret);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return ret;
}

// Packed BCD, two decimal digits per byte, most significant first.
// Digits that do not fit in `width` bytes are dropped; callers range-check first.
inline void append_bcd(std::vector<std::byte>& to, uint32_t val, size_t width)
{
    std::vector<std::byte> packed(width, std::byte{});
    for (size_t i = width; i-- > 0;)
    {
        uint8_t lo = val % 10;
        val /= 10;
        uint8_t hi = val % 10;
        val /= 10;
        packed[i] = int2byte(static_cast<uint8_t>((hi << 4) | lo));
    }
    to.insert(to.end(), packed.begin(), packed.end());
}

inline std::optional<uint32_t> decode_bcd(std::span<const std::byte> from)
{
    uint32_t ret = 0;
    for (std::byte b : from)
    {
        uint8_t hi = std::to_integer<uint8_t>(b >> 4);
        uint8_t lo = std::to_integer<uint8_t>(b & std::byte{0x0F});
        if (hi > 9 || lo > 9)
        {
            return std::nullopt;
        }
        ret = ret * 100 + hi * 10 + lo;
    }
    return ret;
}

} // namespace bytes
