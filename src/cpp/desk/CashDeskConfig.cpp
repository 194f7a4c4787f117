/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/CashDeskConfig.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

CashDeskConfig makeCashDeskConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (!node) {
        throw std::invalid_argument{fmt::format("{}: Missing CashDesk node", sl.function_name())};
    }

    CashDeskConfig config;

    if (auto attr = node.attribute("amountDecimals")) {
        config.amountDecimals = ledger::validateDecimalPlaces(attr.as_uint(), sl);
    }
    if (auto attr = node.attribute("tenant")) {
        config.tenant = attr.as_string();
        if (config.tenant.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: 'tenant' cannot be empty", sl.function_name())};
        }
    }
    config.reportDestination = node.attribute("reportDestination").as_string();
    if (auto attr = node.attribute("fallbackShift")) {
        config.fallbackShift =
            ledger::enumFromString<store::FallbackPolicy>(attr.as_string(), sl);
    }
    if (auto attr = node.attribute("logLevel")) {
        config.logLevel = spdlog::level::from_str(attr.as_string());
        if (config.logLevel == spdlog::level::off
            && std::string_view{attr.as_string()} != "off") {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown logLevel '{}'", sl.function_name(), attr.as_string())};
        }
    }
    if (pugi::xml_node journalNode = node.child("Journal")) {
        config.journalPath = journalNode.attribute("path").as_string();
        if (config.journalPath.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Journal requires a 'path'", sl.function_name())};
        }
    }

    return config;
}

//-------------------------------------------------------------------------

CashDeskConfig loadCashDeskConfig(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing config '{}': {}", ctx, path.c_str(), result.description())};
    }
    return makeCashDeskConfig(doc.child("CashDesk"));
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
