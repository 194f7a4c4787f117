/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/LedgerSignals.hpp"
#include "cashdesk/store/LedgerStore.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

// Everything a ledger service needs, handed in explicitly by its owner.
struct LedgerContext
{
    store::LedgerStore* store;
    LedgerSignals* signals;
    std::shared_ptr<spdlog::logger> logger;
    Clock clock = currentTimestamp;
    store::FallbackPolicy fallbackPolicy = store::FallbackPolicy::LOWEST_ID;

    [[nodiscard]] uint32_t decimalPlaces() const noexcept { return store->decimalPlaces(); }
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
