#pragma once
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "sigma/errors.hpp"

namespace sigma
{

// Fee charged by the switch, carried in T0032 as "RRRRCCCA..." (reason, currency, amount)
struct FeeData
{
    uint16_t reason = 0;
    uint16_t currency = 0;
    uint64_t amount = 0;

    static constexpr size_t reason_digits = 4;
    static constexpr size_t currency_digits = 3;

    [[nodiscard]] static std::expected<FeeData, DecodingError> parse(std::string_view data);
    [[nodiscard]] std::expected<std::string, EncodingError> format() const;

    bool operator==(const FeeData&) const = default;
};

} // namespace sigma
