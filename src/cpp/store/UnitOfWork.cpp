/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/store/UnitOfWork.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

UnitOfWork::UnitOfWork(LedgerStore& store) noexcept
    : m_store{store}
{}

//-------------------------------------------------------------------------

UnitOfWork::~UnitOfWork()
{
    rollback();
    for (auto it = m_held.rbegin(); it != m_held.rend(); ++it) {
        m_store.locks().unlock(*it);
    }
}

//-------------------------------------------------------------------------

void UnitOfWork::acquire(LockKey key)
{
    if (m_held.contains(key)) return;
    if (!m_held.empty() && key < *m_held.rbegin()) {
        throw std::logic_error{fmt::format(
            "{}: Acquiring {} after {} breaks the lock order",
            std::source_location::current().function_name(), key, *m_held.rbegin())};
    }
    m_store.locks().lock(key);
    m_held.insert(key);
}

//-------------------------------------------------------------------------

void UnitOfWork::acquire(std::vector<LockKey> keys)
{
    ranges::sort(keys);
    for (LockKey key : keys | views::unique) {
        acquire(key);
    }
}

//-------------------------------------------------------------------------

void UnitOfWork::release(LockKey key)
{
    if (!m_held.contains(key)) return;
    if (key.domain == LockDomain::SHIFT && m_changes.shifts.contains(key.id)) {
        throw std::logic_error{fmt::format(
            "{}: Releasing {} with staged writes",
            std::source_location::current().function_name(), key)};
    }
    m_store.locks().unlock(key);
    m_held.erase(key);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> UnitOfWork::shift(ShiftId shiftId) const
{
    if (auto it = m_changes.shifts.find(shiftId); it != m_changes.shifts.end()) {
        return it->second;
    }
    return m_store.shift(shiftId);
}

//-------------------------------------------------------------------------

std::optional<ledger::Employee> UnitOfWork::employee(EmployeeId employeeId) const
{
    if (auto it = m_changes.employees.find(employeeId); it != m_changes.employees.end()) {
        return it->second;
    }
    return m_store.employee(employeeId);
}

//-------------------------------------------------------------------------

std::optional<ledger::OrderRecord> UnitOfWork::order(OrderId orderId) const
{
    if (auto it = m_changes.orders.find(orderId); it != m_changes.orders.end()) {
        return it->second;
    }
    return m_store.order(orderId);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> UnitOfWork::openShiftOf(EmployeeId employeeId) const
{
    for (const auto& shift : m_changes.shifts | views::values) {
        if (shift.employeeId == employeeId && shift.isOpen()) {
            return shift;
        }
    }
    auto committed = m_store.openShiftOf(employeeId);
    if (committed.has_value() && m_changes.shifts.contains(committed->id)) {
        return std::nullopt;
    }
    return committed;
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> UnitOfWork::anyOpenShift(FallbackPolicy policy) const
{
    auto candidates = m_store.openShifts();
    std::erase_if(candidates, [this](const auto& shift) {
        return m_changes.shifts.contains(shift.id);
    });
    for (const auto& shift : m_changes.shifts | views::values) {
        if (shift.isOpen()) {
            candidates.push_back(shift);
        }
    }
    if (candidates.empty()) return std::nullopt;

    switch (policy) {
        case FallbackPolicy::LOWEST_ID:
            return ranges::min(candidates, {}, &ledger::Shift::id);
        case FallbackPolicy::MOST_RECENT:
            return ranges::max(candidates, [](const auto& lhs, const auto& rhs) {
                return std::tie(lhs.startTime, lhs.id) < std::tie(rhs.startTime, rhs.id);
            });
    }
    std::unreachable();
}

//-------------------------------------------------------------------------

ShiftId UnitOfWork::insertShift(ledger::Shift shift)
{
    requireActive();
    requireLock(LockKey::employee(shift.employeeId), "insert a shift");
    shift.id = m_store.allocateShiftId();
    const ShiftId shiftId = shift.id;
    m_changes.shifts.insert_or_assign(shiftId, std::move(shift));
    m_changes.insertedShifts.insert(shiftId);
    return shiftId;
}

//-------------------------------------------------------------------------

void UnitOfWork::updateShift(const ledger::Shift& shift)
{
    requireActive();
    requireLock(LockKey::shift(shift.id), "update a shift");
    m_changes.shifts.insert_or_assign(shift.id, shift);
}

//-------------------------------------------------------------------------

void UnitOfWork::updateEmployee(const ledger::Employee& employee)
{
    requireActive();
    requireLock(LockKey::employee(employee.id), "update an employee");
    m_changes.employees.insert_or_assign(employee.id, employee);
}

//-------------------------------------------------------------------------

void UnitOfWork::updateOrder(const ledger::OrderRecord& order)
{
    requireActive();
    requireLock(LockKey::order(order.id), "update an order");
    m_changes.orders.insert_or_assign(order.id, order);
}

//-------------------------------------------------------------------------

void UnitOfWork::appendTransaction(ledger::Transaction transaction)
{
    requireActive();
    requireLock(LockKey::shift(transaction.shiftId), "append a transaction");
    m_changes.transactions.push_back(std::move(transaction));
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> UnitOfWork::commit()
{
    requireActive();
    auto stored = m_store.commit(std::exchange(m_changes, {}));
    m_committed = true;
    return stored;
}

//-------------------------------------------------------------------------

void UnitOfWork::rollback() noexcept
{
    m_changes = {};
}

//-------------------------------------------------------------------------

void UnitOfWork::requireLock(LockKey key, std::string_view action) const
{
    if (!holds(key)) {
        throw std::logic_error{fmt::format(
            "{}: Cannot {} without holding {}",
            std::source_location::current().function_name(), action, key)};
    }
}

//-------------------------------------------------------------------------

void UnitOfWork::requireActive() const
{
    if (m_committed) {
        throw std::logic_error{fmt::format(
            "{}: Unit of work already committed",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------
