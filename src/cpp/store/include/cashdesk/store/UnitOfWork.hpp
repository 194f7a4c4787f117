/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/store/LedgerStore.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

/**
 * One all-or-nothing ledger operation. Row locks are taken in ascending
 * LockKey order and held until the unit is destroyed; writes are staged
 * and reach the store only through commit(). A unit destroyed without
 * committing leaves the store untouched.
 *
 * Reads see the unit's own staged writes over the committed state. Every
 * write requires the lock of the row it touches.
 */
class UnitOfWork
{
public:
    explicit UnitOfWork(LedgerStore& store) noexcept;
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    [[nodiscard]] LedgerStore& store() noexcept { return m_store; }

    void acquire(LockKey key);
    void acquire(std::vector<LockKey> keys);
    void release(LockKey key);
    [[nodiscard]] bool holds(LockKey key) const noexcept { return m_held.contains(key); }

    [[nodiscard]] std::optional<ledger::Shift> shift(ShiftId shiftId) const;
    [[nodiscard]] std::optional<ledger::Employee> employee(EmployeeId employeeId) const;
    [[nodiscard]] std::optional<ledger::OrderRecord> order(OrderId orderId) const;
    [[nodiscard]] std::optional<ledger::Shift> openShiftOf(EmployeeId employeeId) const;
    [[nodiscard]] std::optional<ledger::Shift> anyOpenShift(FallbackPolicy policy) const;

    // Assigns the id; the employee row must be locked.
    ShiftId insertShift(ledger::Shift shift);
    void updateShift(const ledger::Shift& shift);
    void updateEmployee(const ledger::Employee& employee);
    void updateOrder(const ledger::OrderRecord& order);
    void appendTransaction(ledger::Transaction transaction);

    std::vector<ledger::Transaction> commit();
    void rollback() noexcept;

    [[nodiscard]] bool committed() const noexcept { return m_committed; }

private:
    void requireLock(LockKey key, std::string_view action) const;
    void requireActive() const;

    LedgerStore& m_store;
    std::set<LockKey> m_held;
    ChangeSet m_changes;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------
