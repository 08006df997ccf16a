/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AppConfig.hpp"

#include "InMemoryCacheRepository.hpp"
#include "SqliteCacheRepository.hpp"
#include "ValidatorException.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace firmquote::app
{

//-------------------------------------------------------------------------

CacheConfig CacheConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!node) {
        return CacheConfig{};
    }

    const std::string_view backendStr = node.attribute("backend").as_string("memory");
    const auto backend = magic_enum::enum_cast<CacheBackend>(backendStr);
    if (!backend.has_value()) {
        throw ValidatorException{fmt::format(
            "{}: unknown cache backend '{}', expected one of [{}]",
            ctx, backendStr, fmt::join(magic_enum::enum_names<CacheBackend>(), ", "))};
    }

    CacheConfig config{.backend = *backend, .path = node.attribute("path").as_string()};
    if (config.backend == CacheBackend::sqlite && config.path.empty()) {
        throw ValidatorException{fmt::format(
            "{}: attribute 'path' is required for the sqlite backend", ctx)};
    }
    return config;
}

//-------------------------------------------------------------------------

cache::ICacheRepository::Ptr makeRepository(const CacheConfig& config)
{
    switch (config.backend) {
        case CacheBackend::sqlite:
            return std::make_shared<cache::SqliteCacheRepository>(config.path);
        default:
            return std::make_shared<cache::InMemoryCacheRepository>();
    }
}

//-------------------------------------------------------------------------

LoggingConfig LoggingConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    LoggingConfig config;
    if (!node) {
        return config;
    }

    if (pugi::xml_attribute attr = node.attribute("level")) {
        const std::string levelStr = attr.as_string();
        config.level = spdlog::level::from_str(levelStr);
        // from_str maps unknown names to off.
        if (config.level == spdlog::level::off && levelStr != "off") {
            throw ValidatorException{fmt::format("{}: unknown log level '{}'", ctx, levelStr)};
        }
    }
    if (pugi::xml_attribute attr = node.attribute("anomalyLog")) {
        config.anomalyLog = fs::path{attr.as_string()};
    }
    return config;
}

//-------------------------------------------------------------------------

AppConfig AppConfig::fromXML(pugi::xml_node node)
{
    return AppConfig{
        .validator = validator::ValidatorConfig::fromXML(node.child("Validator")),
        .cache = CacheConfig::fromXML(node.child("Cache")),
        .logging = LoggingConfig::fromXML(node.child("Logging"))
    };
}

//-------------------------------------------------------------------------

AppConfig AppConfig::fromFile(const fs::path& path)
{
    const util::Nodes nodes = util::parseConfigFile(path);
    return fromXML(nodes.root);
}

//-------------------------------------------------------------------------

}  // namespace firmquote::app

//-------------------------------------------------------------------------
