/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include "ValidatorException.hpp"

#include <chrono>

//-------------------------------------------------------------------------

namespace firmquote::util
{

//-------------------------------------------------------------------------

Timestamp currentTimestamp() noexcept
{
    using namespace std::chrono;
    return static_cast<Timestamp>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

//-------------------------------------------------------------------------

std::string escapeCsvField(std::string_view field)
{
    if (field.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string escaped{"\""};
    for (char c : field) {
        if (c == '"') escaped.push_back('"');
        escaped.push_back(c);
    }
    escaped.push_back('"');
    return escaped;
}

//-------------------------------------------------------------------------

Nodes parseConfigFile(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    Nodes nodes;
    pugi::xml_parse_result result = nodes.doc.load_file(path.c_str());
    if (!result) {
        throw ValidatorException{fmt::format(
            "{}: error parsing config file '{}': {}", ctx, path.c_str(), result.description())};
    }
    nodes.root = nodes.doc.child("FirmQuote");
    if (!nodes.root) {
        throw ValidatorException{fmt::format(
            "{}: config file '{}' has no <FirmQuote> root element", ctx, path.c_str())};
    }
    return nodes;
}

//-------------------------------------------------------------------------

}  // namespace firmquote::util

//-------------------------------------------------------------------------
