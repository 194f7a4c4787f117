/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/DebtLedger.hpp"
#include "cashdesk/service/TransactionLog.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

class HandoverProcessor
{
public:
    HandoverProcessor(
        const LedgerContext& ctx,
        const DebtLedger& debts,
        const TransactionLog& transactions) noexcept;

    /**
     * Moves the cash an employee collected for the given orders into a
     * cashier's open shift. Ids of unknown, card or already turned-in orders
     * are dropped from the batch without further notice. Every lock of the
     * batch is held until the single commit, so the whole handover applies
     * or none of it does.
     *
     * @returns the amount handed over.
     * @throws ledger::LedgerError with SHIFT_NOT_FOUND, SHIFT_CLOSED,
     *         EMPLOYEE_NOT_FOUND or NO_ELIGIBLE_ORDERS.
     */
    decimal_t process(
        ShiftId cashierShiftId, EmployeeId employeeId, std::span<const OrderId> orderIds);

private:
    const LedgerContext& m_ctx;
    const DebtLedger& m_debts;
    const TransactionLog& m_transactions;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
