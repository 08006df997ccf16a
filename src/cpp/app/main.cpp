/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AnomalyLogger.hpp"
#include "AppConfig.hpp"
#include "QuoteReader.hpp"
#include "firmquote/validator/FirmQuoteValidator.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"Firm quote validator v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Validator config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path quotesFile;
    app.add_option("-q,--quotes-file", quotesFile, "CSV file of quotes to validate")
        ->required()
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    const auto appConfig = firmquote::app::AppConfig::fromFile(config);

    auto logger = spdlog::stderr_color_mt("firmquote");
    logger->set_level(appConfig.logging.level);

    const firmquote::validator::FirmQuoteValidator quoteValidator{
        firmquote::app::makeRepository(appConfig.cache),
        appConfig.validator,
        firmquote::util::currentTimestamp,
        logger};

    std::unique_ptr<firmquote::validator::AnomalyLogger> anomalyLogger;
    if (appConfig.logging.anomalyLog.has_value()) {
        anomalyLogger = std::make_unique<firmquote::validator::AnomalyLogger>(
            *appConfig.logging.anomalyLog, quoteValidator.signals());
    }

    logger->info(
        "Validating quotes from {} against {} cache (staleness threshold {}ms)",
        quotesFile.c_str(), appConfig.cache.backend, appConfig.validator.stalenessThreshold);

    const auto quotes = firmquote::quote::QuoteReader::fromFile(quotesFile);
    for (const auto& amount : quoteValidator.computeFillableAmounts(quotes)) {
        fmt::print("{}\n", amount);
    }

    return 0;
}

//-------------------------------------------------------------------------
