/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/validator/ValidatorConfig.hpp"

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

ValidatorConfig ValidatorConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto timescaleFallback = [] {
        static constexpr auto fallback = Timescale::s;
        fmt::print("Unknown or missing attribute 'timescale', falling back to '{}'\n", fallback);
        return std::make_optional(fallback);
    };

    const pugi::xml_attribute thresholdAttr = node.attribute("stalenessThreshold");
    if (!thresholdAttr) {
        return ValidatorConfig{};
    }

    const Timescale scale = magic_enum::enum_cast<Timescale>(
        node.attribute("timescale").as_string()).or_else(timescaleFallback).value();
    const Timestamp value = thresholdAttr.as_ullong();

    if (value > maxConvertible(scale)) {
        throw std::invalid_argument{fmt::format(
            "{}: 'stalenessThreshold' of {}{} overflows the millisecond range (max {}{})",
            ctx,
            thresholdAttr.as_string(),
            scale,
            maxConvertible(scale),
            scale)};
    }

    const Timestamp threshold = toMilliseconds(value, scale);

    if (threshold == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'stalenessThreshold' of {}{} is below one millisecond",
            ctx,
            thresholdAttr.as_string(),
            scale)};
    }

    return ValidatorConfig{.stalenessThreshold = threshold};
}

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
