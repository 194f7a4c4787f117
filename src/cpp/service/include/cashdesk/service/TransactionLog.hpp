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

class TransactionLog
{
public:
    explicit TransactionLog(const LedgerContext& ctx) noexcept;

    /**
     * Appends one immutable drawer movement to an open shift.
     *
     * @throws ledger::LedgerError with INVALID_AMOUNT, SHIFT_NOT_FOUND or SHIFT_CLOSED.
     */
    ledger::Transaction record(
        ShiftId shiftId, decimal_t amount, ledger::TransactionKind kind, std::string comment);

    ledger::Transaction deposit(ShiftId shiftId, decimal_t amount, std::string comment);
    ledger::Transaction withdraw(ShiftId shiftId, decimal_t amount, std::string comment);

    // Stages the entry in a caller's unit of work; the shift lock is taken here.
    void stage(
        store::UnitOfWork& uow,
        ShiftId shiftId,
        decimal_t amount,
        ledger::TransactionKind kind,
        std::string comment) const;

    [[nodiscard]] std::vector<ledger::Transaction> forShift(ShiftId shiftId) const;
    [[nodiscard]] std::vector<ledger::Transaction> inRange(Timespan span) const;

private:
    const LedgerContext& m_ctx;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
