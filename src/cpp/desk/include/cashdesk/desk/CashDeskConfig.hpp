/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/store/LedgerStore.hpp"

#include <spdlog/common.h>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

struct CashDeskConfig
{
    uint32_t amountDecimals = util::kDefaultDecimalPlaces;
    // Business the ledger books for; stamped on journal lines and archived reports.
    std::string tenant = "default";
    // Directory receiving one JSON file per Z-report, none if empty.
    fs::path reportDestination;
    store::FallbackPolicy fallbackShift = store::FallbackPolicy::LOWEST_ID;
    // CSV event journal, none if empty.
    fs::path journalPath;
    spdlog::level::level_enum logLevel = spdlog::level::info;
};

//-------------------------------------------------------------------------

/**
 * <CashDesk amountDecimals="2" tenant="..." reportDestination="..."
 *           fallbackShift="lowest-id|most-recent" logLevel="info">
 *     <Journal path="..."/>
 * </CashDesk>
 *
 * @throws std::invalid_argument on out-of-range or unknown values.
 */
[[nodiscard]] CashDeskConfig makeCashDeskConfig(pugi::xml_node node);

[[nodiscard]] CashDeskConfig loadCashDeskConfig(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
