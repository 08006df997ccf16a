/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

enum class AssetDataErrorCode : uint32_t
{
    INVALID_HEX,
    INVALID_LENGTH,
    UNSUPPORTED_PROXY,
    NONZERO_PADDING
};

[[nodiscard]] constexpr std::string_view AssetDataErrorCode2StrView(AssetDataErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

//-------------------------------------------------------------------------

// ERC-20 asset data: 4-byte proxy id followed by the token address as one
// left-padded 32-byte ABI word.
inline constexpr std::string_view kERC20ProxyId{"f47261b0"};
inline constexpr size_t kProxyIdHexDigits = 8;
inline constexpr size_t kAbiWordHexDigits = 64;

using ExpectedAddress = std::expected<Address, AssetDataErrorCode>;

[[nodiscard]] ExpectedAddress decodeERC20AssetData(std::string_view assetData);

[[nodiscard]] std::string encodeERC20AssetData(std::string_view tokenAddress);

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::quote::AssetDataErrorCode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::quote::AssetDataErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", firmquote::quote::AssetDataErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
