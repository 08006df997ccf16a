/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/quote/AssetData.hpp"

#include "firmquote/quote/Address.hpp"

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

ExpectedAddress decodeERC20AssetData(std::string_view assetData)
{
    if (!(assetData.starts_with("0x") || assetData.starts_with("0X"))) {
        return std::unexpected{AssetDataErrorCode::INVALID_HEX};
    }
    const std::string hex = normalizeAddress(assetData.substr(2));
    if (!isHexString(hex)) {
        return std::unexpected{AssetDataErrorCode::INVALID_HEX};
    }
    if (hex.size() != kProxyIdHexDigits + kAbiWordHexDigits) {
        return std::unexpected{AssetDataErrorCode::INVALID_LENGTH};
    }
    if (std::string_view{hex}.substr(0, kProxyIdHexDigits) != kERC20ProxyId) {
        return std::unexpected{AssetDataErrorCode::UNSUPPORTED_PROXY};
    }

    const std::string_view word = std::string_view{hex}.substr(kProxyIdHexDigits);
    const std::string_view padding = word.substr(0, kAbiWordHexDigits - kAddressHexDigits);
    if (padding.find_first_not_of('0') != std::string_view::npos) {
        return std::unexpected{AssetDataErrorCode::NONZERO_PADDING};
    }

    return fmt::format("0x{}", word.substr(kAbiWordHexDigits - kAddressHexDigits));
}

//-------------------------------------------------------------------------

std::string encodeERC20AssetData(std::string_view tokenAddress)
{
    if (!isAddress(tokenAddress)) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a valid token address",
            std::source_location::current().function_name(),
            tokenAddress)};
    }
    return fmt::format(
        "0x{}{:0>{}}",
        kERC20ProxyId,
        normalizeAddress(tokenAddress.substr(2)),
        kAbiWordHexDigits);
}

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
