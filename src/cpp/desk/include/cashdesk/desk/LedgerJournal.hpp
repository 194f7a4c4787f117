/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/LedgerSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

/**
 * Appends one CSV line per committed ledger event:
 * timestamp,tenant,event,shiftId,employeeId,orderId,amount,detail
 */
class LedgerJournal
{
public:
    LedgerJournal(
        const fs::path& filepath,
        std::string tenant,
        service::LedgerSignals& signals,
        Clock clock = currentTimestamp);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

private:
    struct Line
    {
        std::string_view event;
        std::optional<ShiftId> shiftId;
        std::optional<EmployeeId> employeeId;
        std::optional<OrderId> orderId;
        std::optional<decimal_t> amount;
        std::string detail;
    };

    void write(const Line& line) const;

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    std::string m_tenant;
    Clock m_clock;
    std::vector<bs2::scoped_connection> m_feeds;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
