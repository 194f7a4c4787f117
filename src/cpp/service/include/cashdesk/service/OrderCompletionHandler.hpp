/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/DebtLedger.hpp"
#include "cashdesk/service/OrderShiftLinker.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

// Where the cash of a completed order ended up.
enum class CashCustody : uint8_t
{
    NOT_CASH,
    EMPLOYEE_DEBT,
    DRAWER,
    UNCHANGED
};

struct CompletionOutcome
{
    OrderId orderId;
    std::optional<ShiftId> linkedShiftId;
    CashCustody custody;
    std::optional<EmployeeId> debtorId;
};

//-------------------------------------------------------------------------

/**
 * Consumer of the order subsystem's "completed" status transition. Links the
 * order to a shift and, for cash orders, books the money either as the
 * courier's (else the waiter's) debt or as already in the drawer. Only the
 * first completion of an order moves money; repeated events just re-run the
 * idempotent link.
 */
class OrderCompletionHandler
{
public:
    OrderCompletionHandler(
        const LedgerContext& ctx,
        const OrderShiftLinker& linker,
        const DebtLedger& debts) noexcept;

    /**
     * @throws ledger::LedgerError with ORDER_NOT_FOUND.
     */
    CompletionOutcome onOrderCompleted(
        OrderId orderId, std::optional<EmployeeId> actingEmployeeId);

private:
    const LedgerContext& m_ctx;
    const OrderShiftLinker& m_linker;
    const DebtLedger& m_debts;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
