/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/quote/Quote.hpp"
#include "common.hpp"

#include <istream>

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

class QuoteReader
{
public:
    static constexpr std::string_view s_header =
        "makerAddress,makerAssetData,makerAssetAmount,takerAssetAmount";

    explicit QuoteReader(std::istream& is) noexcept;

    [[nodiscard]] std::vector<Quote> readAll();

    [[nodiscard]] static std::vector<Quote> fromFile(const fs::path& path);

private:
    [[nodiscard]] Quote parseLine(std::string_view line) const;

    std::istream& m_is;
    size_t m_lineNumber{};
};

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
