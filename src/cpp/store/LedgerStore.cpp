/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/store/LedgerStore.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

#include <mutex>

//-------------------------------------------------------------------------

namespace cashdesk::store
{

//-------------------------------------------------------------------------

namespace
{

template<typename... Args>
[[noreturn]] void throwViolation(fmt::format_string<Args...> fmt, Args&&... args)
{
    throw ledger::LedgerError{
        ledger::ErrorCode::CONSTRAINT_VIOLATION,
        fmt::format(fmt, std::forward<Args>(args)...)};
}

template<typename K, typename V>
[[nodiscard]] std::vector<V> values(const std::map<K, V>& table)
{
    return table | views::values | ranges::to<std::vector>;
}

// Checkpoint amounts obey the same rules as committed ones, at the file's precision.
[[nodiscard]] decimal_t restoredAmount(
    const char* ctx,
    decimal_t amount,
    uint32_t decimalPlaces,
    bool strictlyPositive,
    std::string_view what)
{
    const decimal_t rounded = util::round(amount, decimalPlaces);
    if (rounded < 0_dec || (strictlyPositive && rounded == 0_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: {} must be {}, was {}",
            ctx, what, strictlyPositive ? "positive" : "non-negative", amount)};
    }
    return rounded;
}

template<typename K, typename V>
void restoreRow(const char* ctx, std::map<K, V>& table, V row, std::string_view what)
{
    const K id = row.id;
    if (!table.emplace(id, std::move(row)).second) {
        throw std::invalid_argument{fmt::format("{}: Duplicate {} #{}", ctx, what, id)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

LedgerStore::LedgerStore(uint32_t decimalPlaces)
    : m_decimalPlaces{ledger::validateDecimalPlaces(decimalPlaces)}
{}

//-------------------------------------------------------------------------

void LedgerStore::putEmployee(ledger::Employee employee)
{
    ScopedKeyLock keyLock{m_locks, LockKey::employee(employee.id)};
    std::unique_lock lock{m_mtx};
    auto it = m_employees.find(employee.id);
    if (it != m_employees.end()) {
        it->second.fullName = std::move(employee.fullName);
        it->second.role = employee.role;
        return;
    }
    employee.cashBalance = ledger::validateNonNegativeAmount(
        employee.cashBalance, m_decimalPlaces, "Cash balance");
    m_employees.emplace(employee.id, std::move(employee));
}

//-------------------------------------------------------------------------

void LedgerStore::putOrder(ledger::OrderRecord order)
{
    order.total = ledger::validateNonNegativeAmount(order.total, m_decimalPlaces, "Order total");
    ScopedKeyLock keyLock{m_locks, LockKey::order(order.id)};
    std::unique_lock lock{m_mtx};
    auto it = m_orders.find(order.id);
    if (it != m_orders.end()) {
        auto& stored = it->second;
        stored.paymentMethod = order.paymentMethod;
        stored.total = order.total;
        stored.courierId = order.courierId;
        stored.waiterId = order.waiterId;
        return;
    }
    if (order.linkedShiftId.has_value() && !m_shifts.contains(*order.linkedShiftId)) {
        throwViolation("Order #{} references unknown shift #{}", order.id, *order.linkedShiftId);
    }
    m_orders.emplace(order.id, std::move(order));
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> LedgerStore::shift(ShiftId shiftId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_shifts.find(shiftId);
    if (it == m_shifts.end()) return std::nullopt;
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<ledger::Employee> LedgerStore::employee(EmployeeId employeeId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_employees.find(employeeId);
    if (it == m_employees.end()) return std::nullopt;
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<ledger::OrderRecord> LedgerStore::order(OrderId orderId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_orders.find(orderId);
    if (it == m_orders.end()) return std::nullopt;
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> LedgerStore::openShiftOf(EmployeeId employeeId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_openShiftByEmployee.find(employeeId);
    if (it == m_openShiftByEmployee.end()) return std::nullopt;
    return m_shifts.at(it->second);
}

//-------------------------------------------------------------------------

std::vector<ledger::Shift> LedgerStore::openShifts() const
{
    std::shared_lock lock{m_mtx};
    return m_openShiftByEmployee
        | views::values
        | views::transform([this](ShiftId shiftId) { return m_shifts.at(shiftId); })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

std::vector<ledger::Shift> LedgerStore::shifts() const
{
    std::shared_lock lock{m_mtx};
    return values(m_shifts);
}

//-------------------------------------------------------------------------

std::vector<ledger::Employee> LedgerStore::employees() const
{
    std::shared_lock lock{m_mtx};
    return values(m_employees);
}

//-------------------------------------------------------------------------

std::vector<ledger::OrderRecord> LedgerStore::orders() const
{
    std::shared_lock lock{m_mtx};
    return values(m_orders);
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> LedgerStore::transactions() const
{
    std::shared_lock lock{m_mtx};
    return values(m_transactions);
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> LedgerStore::transactionsForShift(ShiftId shiftId) const
{
    std::shared_lock lock{m_mtx};
    return m_transactions
        | views::values
        | views::filter([shiftId](const auto& tx) { return tx.shiftId == shiftId; })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> LedgerStore::transactionsInRange(Timespan span) const
{
    std::shared_lock lock{m_mtx};
    return m_transactions
        | views::values
        | views::filter([span](const auto& tx) {
            return span.contains(tx.timestamp);
        })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

std::optional<ShiftSnapshot> LedgerStore::shiftSnapshot(ShiftId shiftId) const
{
    std::shared_lock lock{m_mtx};
    auto it = m_shifts.find(shiftId);
    if (it == m_shifts.end()) return std::nullopt;
    return ShiftSnapshot{
        .shift = it->second,
        .orders = m_orders
            | views::values
            | views::filter([shiftId](const auto& order) {
                return order.linkedShiftId == shiftId;
            })
            | ranges::to<std::vector>,
        .transactions = m_transactions
            | views::values
            | views::filter([shiftId](const auto& tx) { return tx.shiftId == shiftId; })
            | ranges::to<std::vector>
    };
}

//-------------------------------------------------------------------------

ShiftId LedgerStore::allocateShiftId() noexcept
{
    return m_nextShiftId.fetch_add(1);
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> LedgerStore::commit(ChangeSet changes)
{
    std::unique_lock lock{m_mtx};

    validate(changes);

    for (auto& [shiftId, shift] : changes.shifts) {
        auto indexed = m_openShiftByEmployee.find(shift.employeeId);
        if (shift.isOpen()) {
            m_openShiftByEmployee[shift.employeeId] = shiftId;
        } else if (indexed != m_openShiftByEmployee.end() && indexed->second == shiftId) {
            m_openShiftByEmployee.erase(indexed);
        }
        m_shifts.insert_or_assign(shiftId, std::move(shift));
    }

    for (const auto& [employeeId, employee] : changes.employees) {
        m_employees.at(employeeId).cashBalance = employee.cashBalance;
    }

    for (const auto& [orderId, order] : changes.orders) {
        auto& stored = m_orders.at(orderId);
        stored.linkedShiftId = order.linkedShiftId;
        stored.turnedIn = order.turnedIn;
        stored.completedAt = order.completedAt;
        stored.debtHolderId = order.debtHolderId;
    }

    std::vector<ledger::Transaction> stored;
    stored.reserve(changes.transactions.size());
    for (auto& tx : changes.transactions) {
        tx.id = m_nextTransactionId++;
        stored.push_back(tx);
        m_transactions.emplace(tx.id, std::move(tx));
    }

    return stored;
}

//-------------------------------------------------------------------------

void LedgerStore::validate(const ChangeSet& changes) const
{
    auto resolveShift = [&](ShiftId shiftId) -> const ledger::Shift* {
        if (auto it = changes.shifts.find(shiftId); it != changes.shifts.end()) {
            return &it->second;
        }
        if (auto it = m_shifts.find(shiftId); it != m_shifts.end()) {
            return &it->second;
        }
        return nullptr;
    };

    auto openShiftByEmployee = m_openShiftByEmployee;
    std::erase_if(openShiftByEmployee, [&](const auto& entry) {
        return changes.shifts.contains(entry.second);
    });

    for (const auto& [shiftId, shift] : changes.shifts) {
        auto committed = m_shifts.find(shiftId);
        if (changes.insertedShifts.contains(shiftId)) {
            if (committed != m_shifts.end()) {
                throwViolation("Shift #{} already exists", shiftId);
            }
        } else if (committed == m_shifts.end()) {
            throwViolation("Shift #{} does not exist", shiftId);
        } else if (committed->second.closed) {
            throwViolation("Shift #{} is closed and cannot be modified", shiftId);
        } else if (committed->second.employeeId != shift.employeeId) {
            throwViolation("Shift #{} cannot change its employee", shiftId);
        }
        if (!m_employees.contains(shift.employeeId)) {
            throwViolation("Shift #{} references unknown employee #{}", shiftId, shift.employeeId);
        }
        if (shift.startCash < 0_dec) {
            throwViolation("Shift #{} has negative start cash {}", shiftId, shift.startCash);
        }
        if (shift.isOpen()) {
            auto [it, inserted] = openShiftByEmployee.emplace(shift.employeeId, shiftId);
            if (!inserted) {
                throwViolation(
                    "Employee #{} already has open shift #{}", shift.employeeId, it->second);
            }
        }
    }

    for (const auto& [employeeId, employee] : changes.employees) {
        if (!m_employees.contains(employeeId)) {
            throwViolation("Employee #{} does not exist", employeeId);
        }
        if (employee.cashBalance < 0_dec) {
            throwViolation(
                "Employee #{} balance would become negative ({})",
                employeeId, employee.cashBalance);
        }
    }

    for (const auto& [orderId, order] : changes.orders) {
        auto committed = m_orders.find(orderId);
        if (committed == m_orders.end()) {
            throwViolation("Order #{} does not exist", orderId);
        }
        const auto& link = committed->second.linkedShiftId;
        if (link.has_value() && order.linkedShiftId != link) {
            throwViolation("Order #{} is already linked to shift #{}", orderId, *link);
        }
        if (!link.has_value() && order.linkedShiftId.has_value()) {
            const ledger::Shift* target = resolveShift(*order.linkedShiftId);
            if (target == nullptr) {
                throwViolation(
                    "Order #{} references unknown shift #{}", orderId, *order.linkedShiftId);
            }
            if (target->closed) {
                throwViolation(
                    "Order #{} cannot be linked to closed shift #{}", orderId, target->id);
            }
        }
    }

    for (const auto& tx : changes.transactions) {
        if (!(tx.amount > 0_dec)) {
            throwViolation("Transaction amount must be positive, was {}", tx.amount);
        }
        const ledger::Shift* shift = resolveShift(tx.shiftId);
        if (shift == nullptr) {
            throwViolation("Transaction references unknown shift #{}", tx.shiftId);
        }
        if (shift->closed) {
            throwViolation("Transaction targets closed shift #{}", tx.shiftId);
        }
    }
}

//-------------------------------------------------------------------------

void LedgerStore::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::DOUBLE);
}

//-------------------------------------------------------------------------

void LedgerStore::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::PACKED);
}

//-------------------------------------------------------------------------

void LedgerStore::serialize(
    rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const
{
    std::shared_lock lock{m_mtx};

    auto serializeTable = [&](const auto& table, const char* name, rapidjson::Document& json) {
        auto& allocator = json.GetAllocator();
        rapidjson::Value rowsJson{rapidjson::kArrayType};
        for (const auto& row : table | views::values) {
            rapidjson::Document rowJson{&allocator};
            if (encoding == json::DecimalEncoding::PACKED) {
                row.checkpointSerialize(rowJson);
            } else {
                row.jsonSerialize(rowJson);
            }
            rowsJson.PushBack(rowJson, allocator);
        }
        json.AddMember(rapidjson::StringRef(name), rowsJson, allocator);
    };

    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("decimalPlaces", rapidjson::Value{m_decimalPlaces}, allocator);
        json.AddMember("nextShiftId", rapidjson::Value{m_nextShiftId.load()}, allocator);
        json.AddMember("nextTransactionId", rapidjson::Value{m_nextTransactionId}, allocator);
        serializeTable(m_employees, "employees", json);
        serializeTable(m_shifts, "shifts", json);
        serializeTable(m_orders, "orders", json);
        serializeTable(m_transactions, "transactions", json);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<LedgerStore> LedgerStore::fromJson(const rapidjson::Value& json)
{
    const char* ctx = std::source_location::current().function_name();

    if (!json.IsObject()) {
        throw std::invalid_argument{fmt::format("{}: Checkpoint must be an object", ctx)};
    }
    for (const char* member : {"decimalPlaces", "employees", "shifts", "orders", "transactions"}) {
        if (!json.HasMember(member)) {
            throw std::invalid_argument{fmt::format(
                "{}: Checkpoint is missing member '{}'", ctx, member)};
        }
    }

    if (!json["decimalPlaces"].IsUint()) {
        throw std::invalid_argument{fmt::format("{}: 'decimalPlaces' must be unsigned", ctx)};
    }
    const uint32_t decimalPlaces = json["decimalPlaces"].GetUint();
    auto store = std::make_unique<LedgerStore>(decimalPlaces);
    auto amount = [&](decimal_t value, std::string_view what, bool strictlyPositive = false) {
        return restoredAmount(ctx, value, decimalPlaces, strictlyPositive, what);
    };

    for (const auto& employeeJson : json["employees"].GetArray()) {
        auto employee = ledger::Employee::fromJson(employeeJson);
        employee.cashBalance = amount(
            employee.cashBalance, fmt::format("Cash balance of employee #{}", employee.id));
        restoreRow(ctx, store->m_employees, std::move(employee), "employee");
    }
    for (const auto& shiftJson : json["shifts"].GetArray()) {
        auto shift = ledger::Shift::fromJson(shiftJson);
        if (!store->m_employees.contains(shift.employeeId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Shift #{} references unknown employee #{}", ctx, shift.id, shift.employeeId)};
        }
        shift.startCash = amount(shift.startCash, fmt::format("Start cash of shift #{}", shift.id));
        if (shift.endCashActual.has_value()) {
            shift.endCashActual = amount(
                *shift.endCashActual, fmt::format("End cash of shift #{}", shift.id));
        }
        if (shift.totals.has_value()) {
            auto& totals = *shift.totals;
            const auto what = fmt::format("Totals of shift #{}", shift.id);
            totals.salesCash = amount(totals.salesCash, what);
            totals.salesCard = amount(totals.salesCard, what);
            totals.serviceIn = amount(totals.serviceIn, what);
            totals.serviceOut = amount(totals.serviceOut, what);
        }
        if (shift.isOpen() && store->m_openShiftByEmployee.contains(shift.employeeId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Employee #{} has more than one open shift", ctx, shift.employeeId)};
        }
        const ShiftId shiftId = shift.id;
        const EmployeeId employeeId = shift.employeeId;
        const bool open = shift.isOpen();
        restoreRow(ctx, store->m_shifts, std::move(shift), "shift");
        if (open) {
            store->m_openShiftByEmployee.emplace(employeeId, shiftId);
        }
    }
    for (const auto& orderJson : json["orders"].GetArray()) {
        auto order = ledger::OrderRecord::fromJson(orderJson);
        if (order.linkedShiftId.has_value() && !store->m_shifts.contains(*order.linkedShiftId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Order #{} references unknown shift #{}",
                ctx, order.id, *order.linkedShiftId)};
        }
        if (order.debtHolderId.has_value() && !store->m_employees.contains(*order.debtHolderId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Order #{} references unknown debt holder #{}",
                ctx, order.id, *order.debtHolderId)};
        }
        order.total = amount(order.total, fmt::format("Total of order #{}", order.id));
        restoreRow(ctx, store->m_orders, std::move(order), "order");
    }
    for (const auto& txJson : json["transactions"].GetArray()) {
        auto tx = ledger::Transaction::fromJson(txJson);
        if (!store->m_shifts.contains(tx.shiftId)) {
            throw std::invalid_argument{fmt::format(
                "{}: Transaction #{} references unknown shift #{}", ctx, tx.id, tx.shiftId)};
        }
        tx.amount = amount(tx.amount, fmt::format("Amount of transaction #{}", tx.id), true);
        restoreRow(ctx, store->m_transactions, std::move(tx), "transaction");
    }

    const ShiftId maxShiftId = store->m_shifts.empty() ? 0 : store->m_shifts.rbegin()->first;
    const TransactionId maxTransactionId =
        store->m_transactions.empty() ? 0 : store->m_transactions.rbegin()->first;
    store->m_nextShiftId = std::max(
        json.HasMember("nextShiftId") ? json["nextShiftId"].GetUint() : 1u, maxShiftId + 1);
    store->m_nextTransactionId = std::max(
        json.HasMember("nextTransactionId") ? json["nextTransactionId"].GetUint() : 1u,
        maxTransactionId + 1);

    return store;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::store

//-------------------------------------------------------------------------
