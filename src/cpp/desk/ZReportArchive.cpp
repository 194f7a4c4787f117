/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/ZReportArchive.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

ZReportArchive::ZReportArchive(
    const fs::path& directory,
    std::string tenant,
    service::LedgerSignals& signals,
    std::shared_ptr<spdlog::logger> logger)
    : m_directory{directory}, m_tenant{std::move(tenant)}, m_logger{std::move(logger)}
{
    fs::create_directories(m_directory);
    m_feed = signals.shiftClosed.connect([this](const report::ShiftReport& report) {
        store(report);
    });
}

//-------------------------------------------------------------------------

fs::path ZReportArchive::pathFor(ShiftId shiftId) const
{
    return m_directory / fmt::format("{}-z-{}.json", m_tenant, shiftId);
}

//-------------------------------------------------------------------------

void ZReportArchive::store(const report::ShiftReport& report) const
{
    const fs::path path = pathFor(report.shiftId);

    rapidjson::Document json;
    report.jsonSerialize(json);
    json.AddMember(
        "tenant", rapidjson::Value{m_tenant.c_str(), json.GetAllocator()}, json.GetAllocator());

    try {
        json::writeJsonFile(json, path, {.indent = json::IndentOptions{}, .decimals = 2});
    }
    catch (const std::runtime_error& e) {
        m_logger->error(
            "Unable to write Z-report of shift #{} to '{}': {}",
            report.shiftId, path.c_str(), e.what());
        return;
    }
    m_logger->info("Z-report of shift #{} archived to '{}'", report.shiftId, path.c_str());
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
