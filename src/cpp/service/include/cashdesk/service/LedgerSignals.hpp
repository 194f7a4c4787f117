/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/ledger/Shift.hpp"
#include "cashdesk/ledger/Transaction.hpp"
#include "cashdesk/report/ShiftReport.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

struct DebtEntry
{
    OrderId orderId;
    EmployeeId employeeId;
    decimal_t amount;
    decimal_t balance;
};

struct HandoverReceipt
{
    ShiftId shiftId;
    EmployeeId employeeId;
    std::vector<OrderId> orderIds;
    decimal_t amount;
    decimal_t balance;
    std::optional<ledger::Transaction> transaction;
};

//-------------------------------------------------------------------------

// Emitted only after the unit of work carrying the change has committed.
struct LedgerSignals
{
    Signal<void(const ledger::Shift&)> shiftOpened;
    Signal<void(const report::ShiftReport&)> shiftClosed;
    Signal<void(const ledger::Transaction&)> transactionRecorded;
    Signal<void(OrderId, ShiftId)> orderLinked;
    Signal<void(OrderId)> orderUnlinked;
    Signal<void(const DebtEntry&)> debtRegistered;
    Signal<void(const HandoverReceipt&)> handoverProcessed;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
