/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "firmquote/cache/ICacheRepository.hpp"
#include "firmquote/validator/ValidatorConfig.hpp"
#include "common.hpp"

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace firmquote::app
{

//-------------------------------------------------------------------------

enum class CacheBackend { memory, sqlite };

struct CacheConfig
{
    CacheBackend backend{CacheBackend::memory};
    fs::path path;

    [[nodiscard]] static CacheConfig fromXML(pugi::xml_node node);
};

[[nodiscard]] cache::ICacheRepository::Ptr makeRepository(const CacheConfig& config);

//-------------------------------------------------------------------------

struct LoggingConfig
{
    spdlog::level::level_enum level{spdlog::level::info};
    std::optional<fs::path> anomalyLog;

    [[nodiscard]] static LoggingConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct AppConfig
{
    validator::ValidatorConfig validator;
    CacheConfig cache;
    LoggingConfig logging;

    [[nodiscard]] static AppConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static AppConfig fromFile(const fs::path& path);
};

//-------------------------------------------------------------------------

}  // namespace firmquote::app

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<firmquote::app::CacheBackend>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(firmquote::app::CacheBackend backend, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(backend));
    }
};

//-------------------------------------------------------------------------
