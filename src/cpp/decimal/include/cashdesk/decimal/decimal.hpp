/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <bit>
#include <optional>
#include <spanstream>
#include <string>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace cashdesk
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace cashdesk

//-------------------------------------------------------------------------

namespace cashdesk::util
{

// Single implicit currency, two minor units.
inline constexpr uint32_t kDefaultDecimalPlaces = 2;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::round(val, decimalPlaces);
}

[[nodiscard]] inline decimal_t trunc(decimal_t val, uint32_t decimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(decimal_t{val}, decimalPlaces);
}

[[nodiscard]] inline std::optional<decimal_t> parseDecimal(const std::string& str)
{
    decimal_t parsed;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, str.c_str()) != 0) {
        return std::nullopt;
    }
    if (BloombergLP::bdldfp::DecimalUtil::isNan(parsed)
        || BloombergLP::bdldfp::DecimalUtil::isInf(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

[[nodiscard]] inline uint64_t packDecimal(decimal_t val)
{
    uint64_t packed;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalToDPD(
        std::bit_cast<uint8_t*>(&packed), val);
    return packed;
}

[[nodiscard]] inline decimal_t unpackDecimal(uint64_t val)
{
    decimal_t unpacked;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalFromDPD(
        &unpacked, std::bit_cast<uint8_t*>(&val));
    return unpacked;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t clampNonNegative(decimal_t val) noexcept
{
    return val < decimal_t{} ? decimal_t{} : val;
}

}  // namespace cashdesk::util

//-------------------------------------------------------------------------

namespace cashdesk::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace cashdesk::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<cashdesk::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(cashdesk::decimal_t val, FormatContext& ctx) const
    {
        using namespace cashdesk::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
