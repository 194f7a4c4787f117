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

// Writes every Z-report to <directory>/<tenant>-z-<shiftId>.json.
class ZReportArchive
{
public:
    ZReportArchive(
        const fs::path& directory,
        std::string tenant,
        service::LedgerSignals& signals,
        std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] fs::path pathFor(ShiftId shiftId) const;

    void store(const report::ShiftReport& report) const;

private:
    fs::path m_directory;
    std::string m_tenant;
    std::shared_ptr<spdlog::logger> m_logger;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
