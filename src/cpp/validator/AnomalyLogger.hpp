/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/validator/ValidatorSignals.hpp"
#include "common.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace firmquote::validator
{

//-------------------------------------------------------------------------

// Appends anomaly and backfill events of a validator to a CSV file.
class AnomalyLogger
{
public:
    static constexpr std::string_view s_header = "time,kind,token,maker,message";
    static constexpr std::string_view s_backfillKind = "BACKFILL";

    AnomalyLogger(const fs::path& filepath, ValidatorSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const AnomalyEvent& event) const;
    void log(const BackfillEvent& event) const;

private:
    void write(
        Timestamp timestamp,
        std::string_view kind,
        std::string_view tokenAddress,
        std::string_view makerAddress,
        std::string_view message) const;

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_anomalyFeed;
    bs2::scoped_connection m_backfillFeed;
};

//-------------------------------------------------------------------------

}  // namespace firmquote::validator

//-------------------------------------------------------------------------
