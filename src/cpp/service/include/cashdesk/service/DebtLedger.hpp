/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/LedgerContext.hpp"
#include "cashdesk/store/UnitOfWork.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

/**
 * Cash that couriers and waiters hold on the business's behalf. Balances
 * only grow through registerDebt() and only shrink through settle(), and
 * neither ever leaves them negative.
 */
class DebtLedger
{
public:
    explicit DebtLedger(const LedgerContext& ctx) noexcept;

    // Unknown orders or employees are logged and skipped.
    std::optional<DebtEntry> registerDebt(OrderId orderId, EmployeeId employeeId);

    // Takes the order and employee locks in the caller's unit of work.
    std::optional<DebtEntry> stageDebt(
        store::UnitOfWork& uow, OrderId orderId, EmployeeId employeeId) const;

    /**
     * Lowers the staged balance by amount, clamped at zero. The employee row
     * must already be locked by the unit of work.
     *
     * @returns the new balance.
     */
    decimal_t settle(store::UnitOfWork& uow, EmployeeId employeeId, decimal_t amount) const;

    /**
     * @throws ledger::LedgerError with EMPLOYEE_NOT_FOUND.
     */
    [[nodiscard]] decimal_t balance(EmployeeId employeeId) const;

    [[nodiscard]] std::vector<ledger::Employee> debtors() const;

    // Cash orders booked as the employee's debt and not yet turned in.
    [[nodiscard]] std::vector<ledger::OrderRecord> outstandingOrders(EmployeeId employeeId) const;

private:
    const LedgerContext& m_ctx;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
