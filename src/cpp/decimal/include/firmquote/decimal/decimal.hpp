/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) ::firmquote::util::parseDecimal(#lit)

//-------------------------------------------------------------------------

namespace firmquote
{

using decimal_t = boost::multiprecision::cpp_rational;
using integer_t = boost::multiprecision::cpp_int;

}  // namespace firmquote

//-------------------------------------------------------------------------

namespace firmquote::util
{

inline constexpr uint32_t kMaxExponentDigits = 4;

[[nodiscard]] inline std::optional<decimal_t> tryParseDecimal(std::string_view str)
{
    auto isDigit = [](char c) { return c >= '0' && c <= '9'; };

    if (str.empty()) return std::nullopt;

    bool negative = false;
    if (str.front() == '-' || str.front() == '+') {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }

    int64_t exponent{};
    if (const auto pos = str.find_first_of("eE"); pos != std::string_view::npos) {
        std::string_view expStr = str.substr(pos + 1);
        str = str.substr(0, pos);
        bool expNegative = false;
        if (!expStr.empty() && (expStr.front() == '-' || expStr.front() == '+')) {
            expNegative = expStr.front() == '-';
            expStr.remove_prefix(1);
        }
        if (expStr.empty() || expStr.size() > kMaxExponentDigits
            || !std::ranges::all_of(expStr, isDigit)) {
            return std::nullopt;
        }
        for (char c : expStr) {
            exponent = exponent * 10 + (c - '0');
        }
        if (expNegative) exponent = -exponent;
    }

    const auto dot = str.find('.');
    const std::string_view intPart = str.substr(0, dot);
    const std::string_view fracPart =
        dot == std::string_view::npos ? std::string_view{} : str.substr(dot + 1);
    if (intPart.empty() && fracPart.empty()) return std::nullopt;
    if (!std::ranges::all_of(intPart, isDigit) || !std::ranges::all_of(fracPart, isDigit)) {
        return std::nullopt;
    }

    integer_t mantissa{};
    for (char c : intPart) {
        mantissa = mantissa * 10 + (c - '0');
    }
    for (char c : fracPart) {
        mantissa = mantissa * 10 + (c - '0');
    }
    exponent -= static_cast<int64_t>(fracPart.size());

    const integer_t scale = boost::multiprecision::pow(
        integer_t{10}, static_cast<unsigned>(exponent < 0 ? -exponent : exponent));
    decimal_t value = exponent < 0 ? decimal_t{mantissa, scale} : decimal_t{integer_t{mantissa * scale}};
    if (negative) {
        value = -value;
    }
    return value;
}

[[nodiscard]] inline decimal_t parseDecimal(std::string_view str)
{
    if (auto value = tryParseDecimal(str)) {
        return std::move(value).value();
    }
    throw std::invalid_argument{fmt::format("parseDecimal: malformed decimal '{}'", str)};
}

[[nodiscard]] inline bool isIntegral(const decimal_t& val)
{
    return boost::multiprecision::denominator(val) == 1;
}

// Rounds toward zero.
[[nodiscard]] inline decimal_t trunc(const decimal_t& val)
{
    const integer_t quotient =
        boost::multiprecision::numerator(val) / boost::multiprecision::denominator(val);
    return decimal_t{quotient};
}

[[nodiscard]] inline std::string decimalToString(const decimal_t& val)
{
    integer_t num = boost::multiprecision::numerator(val);
    const integer_t den = boost::multiprecision::denominator(val);
    const std::string_view sign = num < 0 ? "-" : "";
    if (num < 0) num = -num;

    uint32_t twos{}, fives{};
    integer_t rest = den;
    while (rest % 2 == 0) {
        rest /= 2;
        ++twos;
    }
    while (rest % 5 == 0) {
        rest /= 5;
        ++fives;
    }
    if (rest != 1) {
        return fmt::format("{}{}/{}", sign, num.str(), den.str());
    }

    const uint32_t places = std::max(twos, fives);
    const integer_t scaled = num * boost::multiprecision::pow(integer_t{10}, places) / den;
    std::string digits = scaled.str();
    if (places > 0) {
        if (digits.size() <= places) {
            digits.insert(0, places - digits.size() + 1, '0');
        }
        digits.insert(digits.size() - places, 1, '.');
    }
    return fmt::format("{}{}", sign, digits);
}

}  // namespace firmquote::util

//-------------------------------------------------------------------------

namespace firmquote::literals
{

[[nodiscard]] inline decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace firmquote::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const firmquote::decimal_t& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", firmquote::util::decimalToString(val));
    }
};

//-------------------------------------------------------------------------
