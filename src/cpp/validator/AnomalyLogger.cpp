/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AnomalyLogger.hpp"

#include "util.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

AnomalyLogger::AnomalyLogger(const fs::path& filepath, ValidatorSignals& signals)
    : m_filepath{filepath}
{
    std::error_code ec;
    const bool hasContent = fs::exists(m_filepath, ec) && fs::file_size(m_filepath, ec) > 0;

    m_logger = std::make_unique<spdlog::logger>(
        "AnomalyLogger", std::make_shared<spdlog::sinks::basic_file_sink_mt>(m_filepath.string()));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    if (!hasContent) {
        m_logger->trace(s_header);
        m_logger->flush();
    }

    m_anomalyFeed = signals.anomaly.connect([this](const AnomalyEvent& event) { log(event); });
    m_backfillFeed = signals.backfill.connect([this](const BackfillEvent& event) { log(event); });
}

//-------------------------------------------------------------------------

void AnomalyLogger::log(const AnomalyEvent& event) const
{
    write(
        event.timestamp,
        magic_enum::enum_name(event.kind),
        event.tokenAddress,
        event.makerAddress,
        event.message);
}

//-------------------------------------------------------------------------

void AnomalyLogger::log(const BackfillEvent& event) const
{
    write(
        event.timestamp,
        s_backfillKind,
        event.tokenAddress,
        fmt::format("{}", fmt::join(event.makerAddresses, ";")),
        fmt::format(
            "registered {} of {} maker addresses",
            event.inserted, event.makerAddresses.size()));
}

//-------------------------------------------------------------------------

void AnomalyLogger::write(
    Timestamp timestamp,
    std::string_view kind,
    std::string_view tokenAddress,
    std::string_view makerAddress,
    std::string_view message) const
{
    m_logger->trace(
        "{},{},{},{},{}",
        timestamp,
        kind,
        util::escapeCsvField(tokenAddress),
        util::escapeCsvField(makerAddress),
        util::escapeCsvField(message));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
