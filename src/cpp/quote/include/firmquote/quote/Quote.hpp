/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

class Quote
{
public:
    Quote(
        Address makerAddress,
        Address makerAssetAddress,
        decimal_t makerAssetAmount,
        decimal_t takerAssetAmount);

    [[nodiscard]] const Address& makerAddress() const noexcept { return m_makerAddress; }
    [[nodiscard]] const Address& makerAssetAddress() const noexcept { return m_makerAssetAddress; }
    [[nodiscard]] const decimal_t& makerAssetAmount() const noexcept { return m_makerAssetAmount; }
    [[nodiscard]] const decimal_t& takerAssetAmount() const noexcept { return m_takerAssetAmount; }

    [[nodiscard]] static Quote fromAssetData(
        Address makerAddress,
        std::string_view makerAssetData,
        decimal_t makerAssetAmount,
        decimal_t takerAssetAmount);

private:
    Address m_makerAddress;
    Address m_makerAssetAddress;
    decimal_t m_makerAssetAmount;
    decimal_t m_takerAssetAmount;
};

//-------------------------------------------------------------------------

class QuoteException : public std::runtime_error
{
public:
    explicit QuoteException(const std::string& message) : std::runtime_error{message} {}
};

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::quote::Quote>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const firmquote::quote::Quote& quote, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{{maker = {}, token = {}, makerAmount = {}, takerAmount = {}}}",
            quote.makerAddress(),
            quote.makerAssetAddress(),
            quote.makerAssetAmount(),
            quote.takerAssetAmount());
    }
};

//-------------------------------------------------------------------------
