/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Serializable.hpp"
#include "cashdesk/ledger/Employee.hpp"
#include "cashdesk/ledger/OrderRecord.hpp"
#include "cashdesk/ledger/Shift.hpp"
#include "cashdesk/ledger/Transaction.hpp"
#include "cashdesk/store/KeyedLockTable.hpp"

#include <atomic>
#include <shared_mutex>

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

// Which open shift receives an order whose preferred employee has none.
enum class FallbackPolicy : uint8_t
{
    LOWEST_ID,
    MOST_RECENT
};

//-------------------------------------------------------------------------

// Everything a statistics computation reads, taken under a single read lock.
struct ShiftSnapshot
{
    ledger::Shift shift;
    std::vector<ledger::OrderRecord> orders;
    std::vector<ledger::Transaction> transactions;
};

//-------------------------------------------------------------------------

// Staged writes of one unit of work.
struct ChangeSet
{
    std::map<ShiftId, ledger::Shift> shifts;
    std::set<ShiftId> insertedShifts;
    std::map<EmployeeId, ledger::Employee> employees;
    std::map<OrderId, ledger::OrderRecord> orders;
    std::vector<ledger::Transaction> transactions;

    [[nodiscard]] bool empty() const noexcept
    {
        return shifts.empty() && employees.empty() && orders.empty() && transactions.empty();
    }
};

//-------------------------------------------------------------------------

class LedgerStore
{
public:
    explicit LedgerStore(uint32_t decimalPlaces = util::kDefaultDecimalPlaces);

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    [[nodiscard]] uint32_t decimalPlaces() const noexcept { return m_decimalPlaces; }
    [[nodiscard]] KeyedLockTable& locks() noexcept { return m_locks; }

    // Writes owned by the employee and order subsystems. Ledger-owned
    // fields (balance, link, turned-in, completion) of existing rows are kept.
    void putEmployee(ledger::Employee employee);
    void putOrder(ledger::OrderRecord order);

    [[nodiscard]] std::optional<ledger::Shift> shift(ShiftId shiftId) const;
    [[nodiscard]] std::optional<ledger::Employee> employee(EmployeeId employeeId) const;
    [[nodiscard]] std::optional<ledger::OrderRecord> order(OrderId orderId) const;
    [[nodiscard]] std::optional<ledger::Shift> openShiftOf(EmployeeId employeeId) const;
    [[nodiscard]] std::vector<ledger::Shift> openShifts() const;

    [[nodiscard]] std::vector<ledger::Shift> shifts() const;
    [[nodiscard]] std::vector<ledger::Employee> employees() const;
    [[nodiscard]] std::vector<ledger::OrderRecord> orders() const;
    [[nodiscard]] std::vector<ledger::Transaction> transactions() const;
    [[nodiscard]] std::vector<ledger::Transaction> transactionsForShift(ShiftId shiftId) const;
    [[nodiscard]] std::vector<ledger::Transaction> transactionsInRange(Timespan span) const;
    [[nodiscard]] std::optional<ShiftSnapshot> shiftSnapshot(ShiftId shiftId) const;

    [[nodiscard]] ShiftId allocateShiftId() noexcept;

    /**
     * Validates the staged changes against the committed state and applies
     * them atomically. Transactions receive their ids here; the stored
     * transactions are returned in staging order.
     *
     * @throws ledger::LedgerError with CONSTRAINT_VIOLATION if any constraint fails,
     *         in which case nothing is applied.
     */
    std::vector<ledger::Transaction> commit(ChangeSet changes);

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static std::unique_ptr<LedgerStore> fromJson(const rapidjson::Value& json);

private:
    void validate(const ChangeSet& changes) const;
    void serialize(
        rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const;

    uint32_t m_decimalPlaces;
    mutable std::shared_mutex m_mtx;
    KeyedLockTable m_locks;
    std::atomic<ShiftId> m_nextShiftId{1};
    TransactionId m_nextTransactionId{1};

    std::map<ShiftId, ledger::Shift> m_shifts;
    std::map<TransactionId, ledger::Transaction> m_transactions;
    std::map<EmployeeId, ledger::Employee> m_employees;
    std::map<OrderId, ledger::OrderRecord> m_orders;
    std::map<EmployeeId, ShiftId> m_openShiftByEmployee;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------
