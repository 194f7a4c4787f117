/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/store/LedgerStore.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::report
{

//-------------------------------------------------------------------------

struct CashFlowEntry
{
    ledger::Transaction transaction;
    // Owner of the shift the movement went through.
    std::string employeeName;
};

struct CashFlowReport
{
    Timespan span{};
    decimal_t cashRevenue{};
    decimal_t cardRevenue{};
    decimal_t totalRevenue{};
    decimal_t totalDeposits{};
    decimal_t totalExpenses{};
    decimal_t totalHandovers{};
    // Newest first.
    std::vector<CashFlowEntry> entries;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

struct WorkerStats
{
    EmployeeId employeeId{};
    std::string fullName;
    // COURIER or WAITER: the capacity the orders were served in.
    ledger::EmployeeRole capacity{ledger::EmployeeRole::COURIER};
    uint32_t orderCount{};
    decimal_t total{};
    decimal_t averageCheck{};
};

struct WorkerReport
{
    Timespan span{};
    // Highest total first.
    std::vector<WorkerStats> rows;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

// Revenue of the orders completed within span, and every drawer movement in it.
[[nodiscard]] CashFlowReport makeCashFlowReport(const store::LedgerStore& store, Timespan span);

// Orders completed within span, per courier and per waiter. A waiter is only
// credited for orders no courier delivered.
[[nodiscard]] WorkerReport makeWorkerReport(const store::LedgerStore& store, Timespan span);

//-------------------------------------------------------------------------

}  // namespace cashdesk::report

//-------------------------------------------------------------------------
