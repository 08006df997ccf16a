/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/quote/Address.hpp"

#include <boost/algorithm/string.hpp>

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

bool isHexString(std::string_view str) noexcept
{
    return std::ranges::all_of(str, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

//-------------------------------------------------------------------------

bool isAddress(std::string_view str) noexcept
{
    return str.size() == kAddressHexDigits + 2
        && (str.starts_with("0x") || str.starts_with("0X"))
        && isHexString(str.substr(2));
}

//-------------------------------------------------------------------------

Address normalizeAddress(std::string_view str)
{
    return boost::algorithm::to_lower_copy(std::string{str});
}

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
