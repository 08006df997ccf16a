/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "firmquote/quote/Quote.hpp"

#include "firmquote/quote/AssetData.hpp"

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

Quote::Quote(
    Address makerAddress,
    Address makerAssetAddress,
    decimal_t makerAssetAmount,
    decimal_t takerAssetAmount)
    : m_makerAddress{std::move(makerAddress)},
      m_makerAssetAddress{std::move(makerAssetAddress)},
      m_makerAssetAmount{std::move(makerAssetAmount)},
      m_takerAssetAmount{std::move(takerAssetAmount)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (m_makerAssetAmount < 0 || m_takerAssetAmount < 0) {
        throw QuoteException{fmt::format(
            "{}: Asset amounts must be non-negative, were {} (maker) and {} (taker)",
            ctx, m_makerAssetAmount, m_takerAssetAmount)};
    }
}

//-------------------------------------------------------------------------

Quote Quote::fromAssetData(
    Address makerAddress,
    std::string_view makerAssetData,
    decimal_t makerAssetAmount,
    decimal_t takerAssetAmount)
{
    auto tokenAddress = decodeERC20AssetData(makerAssetData);
    if (!tokenAddress) {
        throw QuoteException{fmt::format(
            "{}: Cannot decode maker asset data '{}' of maker {}: {}",
            std::source_location::current().function_name(),
            makerAssetData,
            makerAddress,
            tokenAddress.error())};
    }
    return Quote{
        std::move(makerAddress),
        std::move(tokenAddress).value(),
        std::move(makerAssetAmount),
        std::move(takerAssetAmount)};
}

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
