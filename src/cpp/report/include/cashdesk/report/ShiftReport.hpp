/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Serializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::report
{

//-------------------------------------------------------------------------

/**
 * X-report while the shift is open, Z-report once frozen at close.
 *
 * Sales are the business view: every order attributed to the shift, whether
 * or not its cash ever reached a drawer. The drawer view is carried by
 * collectedCashOrders and theoreticalCash. The two are never merged.
 */
struct ShiftReport
{
    ShiftId shiftId{};
    EmployeeId employeeId{};
    Timestamp startTime{};
    std::optional<Timestamp> endTime;
    decimal_t startCash{};
    decimal_t salesCash{};
    decimal_t salesCard{};
    decimal_t totalSales{};
    decimal_t serviceIn{};
    decimal_t serviceOut{};
    // Informational, already covered by collectedCashOrders.
    decimal_t handoverIn{};
    decimal_t collectedCashOrders{};
    decimal_t theoreticalCash{};
    std::optional<decimal_t> endCashActual;
    // endCashActual - theoreticalCash.
    std::optional<decimal_t> discrepancy;
    bool final{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::report

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<cashdesk::report::ShiftReport>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cashdesk::report::ShiftReport& report, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{}-report shift #{}: sales {} (cash {}, card {}), in {}, out {}, "
            "handover {}, theoretical cash {}",
            report.final ? 'Z' : 'X',
            report.shiftId,
            report.totalSales,
            report.salesCash,
            report.salesCard,
            report.serviceIn,
            report.serviceOut,
            report.handoverIn,
            report.theoreticalCash);
    }
};

//-------------------------------------------------------------------------
