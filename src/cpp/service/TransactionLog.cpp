/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/TransactionLog.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

TransactionLog::TransactionLog(const LedgerContext& ctx) noexcept
    : m_ctx{ctx}
{}

//-------------------------------------------------------------------------

ledger::Transaction TransactionLog::record(
    ShiftId shiftId, decimal_t amount, ledger::TransactionKind kind, std::string comment)
{
    store::UnitOfWork uow{*m_ctx.store};
    stage(uow, shiftId, amount, kind, std::move(comment));
    auto stored = uow.commit();

    const auto& tx = stored.front();
    m_ctx.logger->info("Recorded transaction {}", tx);
    m_ctx.signals->transactionRecorded(tx);

    return tx;
}

//-------------------------------------------------------------------------

ledger::Transaction TransactionLog::deposit(ShiftId shiftId, decimal_t amount, std::string comment)
{
    return record(shiftId, amount, ledger::TransactionKind::MANUAL_IN, std::move(comment));
}

//-------------------------------------------------------------------------

ledger::Transaction TransactionLog::withdraw(ShiftId shiftId, decimal_t amount, std::string comment)
{
    return record(shiftId, amount, ledger::TransactionKind::MANUAL_OUT, std::move(comment));
}

//-------------------------------------------------------------------------

void TransactionLog::stage(
    store::UnitOfWork& uow,
    ShiftId shiftId,
    decimal_t amount,
    ledger::TransactionKind kind,
    std::string comment) const
{
    const decimal_t validated = ledger::validatePositiveAmount(
        amount, m_ctx.decimalPlaces(), "Transaction amount");

    uow.acquire(store::LockKey::shift(shiftId));

    const auto shift = uow.shift(shiftId);
    if (!shift.has_value()) {
        ledger::throwShiftNotFound(shiftId);
    }
    if (shift->closed) {
        throw ledger::LedgerError{
            ledger::ErrorCode::SHIFT_CLOSED,
            fmt::format("Shift #{} is closed, no more cash movements allowed", shiftId)};
    }

    uow.appendTransaction(ledger::Transaction{
        .shiftId = shiftId,
        .amount = validated,
        .kind = kind,
        .comment = std::move(comment),
        .timestamp = m_ctx.clock()
    });
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> TransactionLog::forShift(ShiftId shiftId) const
{
    return m_ctx.store->transactionsForShift(shiftId);
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> TransactionLog::inRange(Timespan span) const
{
    return m_ctx.store->transactionsInRange(span);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
