/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/StatisticsEngine.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

/**
 * Lifecycle of cash-register shifts: Open -> Closed, one way. An employee
 * owns at most one open shift; the check and the insert run under the
 * employee's row lock, and the store re-checks uniqueness at commit.
 */
class ShiftStore
{
public:
    ShiftStore(const LedgerContext& ctx, const StatisticsEngine& statistics) noexcept;

    /**
     * @throws ledger::LedgerError with INVALID_AMOUNT, EMPLOYEE_NOT_FOUND or ALREADY_OPEN.
     */
    ledger::Shift open(EmployeeId employeeId, decimal_t startCash);

    /**
     * Freezes the statistics of this instant onto the shift and returns the Z-report.
     *
     * @throws ledger::LedgerError with INVALID_AMOUNT, SHIFT_NOT_FOUND or ALREADY_CLOSED.
     */
    report::ShiftReport close(ShiftId shiftId, decimal_t endCashActual);

    [[nodiscard]] std::optional<ledger::Shift> openShiftOf(EmployeeId employeeId) const;
    [[nodiscard]] std::optional<ledger::Shift> anyOpenShift() const;
    [[nodiscard]] std::optional<ledger::Shift> get(ShiftId shiftId) const;
    [[nodiscard]] std::vector<ledger::Shift> list(
        std::optional<EmployeeId> employeeId = {}) const;

private:
    const LedgerContext& m_ctx;
    const StatisticsEngine& m_statistics;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
