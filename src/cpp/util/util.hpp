/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"
#include "common.hpp"

#include <pugixml.hpp>

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace firmquote::util
{

//-------------------------------------------------------------------------

[[nodiscard]] Timestamp currentTimestamp() noexcept;

// Age of `reference` at `now`; a reference later than `now` has age zero.
[[nodiscard]] constexpr Timestamp elapsedSince(Timestamp reference, Timestamp now) noexcept
{
    return now > reference ? now - reference : 0;
}

[[nodiscard]] std::string escapeCsvField(std::string_view field);

struct Nodes
{
    pugi::xml_document doc;
    pugi::xml_node root;
};

[[nodiscard]] Nodes parseConfigFile(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace firmquote::util

//-------------------------------------------------------------------------
