/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::quote
{

inline constexpr size_t kAddressHexDigits = 40;

[[nodiscard]] bool isHexString(std::string_view str) noexcept;

// `0x` followed by 40 hex digits, either case.
[[nodiscard]] bool isAddress(std::string_view str) noexcept;

[[nodiscard]] Address normalizeAddress(std::string_view str);

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
