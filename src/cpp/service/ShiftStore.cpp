/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/ShiftStore.hpp"

#include "cashdesk/ledger/LedgerError.hpp"
#include "cashdesk/store/UnitOfWork.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

ShiftStore::ShiftStore(const LedgerContext& ctx, const StatisticsEngine& statistics) noexcept
    : m_ctx{ctx}, m_statistics{statistics}
{}

//-------------------------------------------------------------------------

ledger::Shift ShiftStore::open(EmployeeId employeeId, decimal_t startCash)
{
    using ledger::ErrorCode;
    using ledger::LedgerError;

    const decimal_t cash =
        ledger::validateNonNegativeAmount(startCash, m_ctx.decimalPlaces(), "Start cash");

    store::UnitOfWork uow{*m_ctx.store};
    uow.acquire(store::LockKey::employee(employeeId));

    const auto employee = uow.employee(employeeId);
    if (!employee.has_value()) {
        ledger::throwEmployeeNotFound(employeeId);
    }
    if (const auto current = uow.openShiftOf(employeeId)) {
        throw LedgerError{
            ErrorCode::ALREADY_OPEN,
            fmt::format("{} already has open shift #{}", employee.value(), current->id)};
    }

    ledger::Shift shift{
        .employeeId = employeeId,
        .startTime = m_ctx.clock(),
        .startCash = cash
    };
    shift.id = uow.insertShift(shift);
    uow.commit();

    m_ctx.logger->info(
        "Shift #{} opened by {} with {} in the drawer", shift.id, employee.value(), cash);
    m_ctx.signals->shiftOpened(shift);

    return shift;
}

//-------------------------------------------------------------------------

report::ShiftReport ShiftStore::close(ShiftId shiftId, decimal_t endCashActual)
{
    using ledger::ErrorCode;
    using ledger::LedgerError;

    const decimal_t endCash =
        ledger::validateNonNegativeAmount(endCashActual, m_ctx.decimalPlaces(), "End cash");

    store::UnitOfWork uow{*m_ctx.store};
    uow.acquire(store::LockKey::shift(shiftId));

    auto shift = uow.shift(shiftId);
    if (!shift.has_value()) {
        ledger::throwShiftNotFound(shiftId);
    }
    if (shift->closed) {
        throw LedgerError{
            ErrorCode::ALREADY_CLOSED, fmt::format("Shift #{} is already closed", shiftId)};
    }

    // Links, handovers and transactions into this shift all need its lock,
    // so the figures cannot move between here and the commit below.
    auto report = m_statistics.compute(shiftId);

    shift->endTime = m_ctx.clock();
    shift->endCashActual = endCash;
    shift->closed = true;
    shift->totals = ledger::ShiftTotals{
        .salesCash = report.salesCash,
        .salesCard = report.salesCard,
        .serviceIn = report.serviceIn,
        .serviceOut = report.serviceOut
    };
    uow.updateShift(shift.value());
    uow.commit();

    report.endTime = shift->endTime;
    report.endCashActual = endCash;
    report.discrepancy = endCash - report.theoreticalCash;
    report.final = true;

    m_ctx.logger->info(
        "Shift #{} closed: theoretical {}, counted {}, discrepancy {}",
        shiftId, report.theoreticalCash, endCash, report.discrepancy.value());
    m_ctx.signals->shiftClosed(report);

    return report;
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> ShiftStore::openShiftOf(EmployeeId employeeId) const
{
    return m_ctx.store->openShiftOf(employeeId);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> ShiftStore::anyOpenShift() const
{
    return store::UnitOfWork{*m_ctx.store}.anyOpenShift(m_ctx.fallbackPolicy);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> ShiftStore::get(ShiftId shiftId) const
{
    return m_ctx.store->shift(shiftId);
}

//-------------------------------------------------------------------------

std::vector<ledger::Shift> ShiftStore::list(std::optional<EmployeeId> employeeId) const
{
    auto shifts = m_ctx.store->shifts();
    if (employeeId.has_value()) {
        std::erase_if(shifts, [&](const auto& shift) { return shift.employeeId != *employeeId; });
    }
    return shifts;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
