/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "QuoteReader.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>

//-------------------------------------------------------------------------

namespace firmquote::quote
{

//-------------------------------------------------------------------------

QuoteReader::QuoteReader(std::istream& is) noexcept
    : m_is{is}
{}

//-------------------------------------------------------------------------

std::vector<Quote> QuoteReader::readAll()
{
    std::vector<Quote> quotes;
    std::string line;
    while (std::getline(m_is, line)) {
        ++m_lineNumber;
        boost::algorithm::trim(line);
        if (line.empty() || line.starts_with('#')) continue;
        if (m_lineNumber == 1 && line == s_header) continue;
        quotes.push_back(parseLine(line));
    }
    return quotes;
}

//-------------------------------------------------------------------------

std::vector<Quote> QuoteReader::fromFile(const fs::path& path)
{
    std::ifstream ifs{path};
    if (!ifs) {
        throw QuoteException{fmt::format(
            "{}: Unable to open quote file '{}'",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    return QuoteReader{ifs}.readAll();
}

//-------------------------------------------------------------------------

Quote QuoteReader::parseLine(std::string_view line) const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::vector<std::string> fields;
    boost::algorithm::split(fields, line, boost::algorithm::is_any_of(","));
    if (fields.size() != 4) {
        throw QuoteException{fmt::format(
            "{}: Line {} has {} fields, expected 4 ({})",
            ctx, m_lineNumber, fields.size(), s_header)};
    }
    for (auto& field : fields) {
        boost::algorithm::trim(field);
    }

    auto parseAmount = [&](const std::string& field) {
        auto amount = util::tryParseDecimal(field);
        if (!amount) {
            throw QuoteException{fmt::format(
                "{}: Line {} has malformed amount '{}'", ctx, m_lineNumber, field)};
        }
        return std::move(amount).value();
    };

    return Quote::fromAssetData(
        fields[0], fields[1], parseAmount(fields[2]), parseAmount(fields[3]));
}

//-------------------------------------------------------------------------

}  // namespace firmquote::quote

//-------------------------------------------------------------------------
