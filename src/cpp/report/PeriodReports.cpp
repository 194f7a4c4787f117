/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/report/PeriodReports.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::report
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::vector<ledger::OrderRecord> ordersCompletedIn(
    const store::LedgerStore& store, Timespan span)
{
    auto orders = store.orders();
    std::erase_if(orders, [span](const auto& order) {
        return !order.completedAt.has_value() || !span.contains(order.completedAt.value());
    });
    return orders;
}

void setSpanMembers(rapidjson::Document& json, Timespan span)
{
    auto& allocator = json.GetAllocator();
    json.AddMember("from", rapidjson::Value{span.begin}, allocator);
    json.AddMember("to", rapidjson::Value{span.end}, allocator);
}

}  // namespace

//-------------------------------------------------------------------------

CashFlowReport makeCashFlowReport(const store::LedgerStore& store, Timespan span)
{
    using ledger::TransactionKind;

    CashFlowReport report{.span = span};

    for (const auto& order : ordersCompletedIn(store, span)) {
        (order.isCash() ? report.cashRevenue : report.cardRevenue) += order.total;
    }
    report.totalRevenue = report.cashRevenue + report.cardRevenue;

    auto transactions = store.transactionsInRange(span);
    ranges::sort(transactions, [](const auto& lhs, const auto& rhs) {
        return std::tie(lhs.timestamp, lhs.id) > std::tie(rhs.timestamp, rhs.id);
    });

    std::map<ShiftId, std::string> ownerNames;
    auto ownerName = [&](ShiftId shiftId) -> const std::string& {
        auto it = ownerNames.find(shiftId);
        if (it != ownerNames.end()) return it->second;
        std::string name = "System";
        if (const auto shift = store.shift(shiftId)) {
            if (const auto employee = store.employee(shift->employeeId)) {
                name = employee->fullName;
            }
        }
        return ownerNames.emplace(shiftId, std::move(name)).first->second;
    };

    report.entries.reserve(transactions.size());
    for (auto& tx : transactions) {
        switch (tx.kind) {
            case TransactionKind::MANUAL_IN:
                report.totalDeposits += tx.amount;
                break;
            case TransactionKind::MANUAL_OUT:
                report.totalExpenses += tx.amount;
                break;
            case TransactionKind::HANDOVER_IN:
                report.totalHandovers += tx.amount;
                break;
        }
        std::string name = ownerName(tx.shiftId);
        report.entries.push_back(
            CashFlowEntry{.transaction = std::move(tx), .employeeName = std::move(name)});
    }

    return report;
}

//-------------------------------------------------------------------------

WorkerReport makeWorkerReport(const store::LedgerStore& store, Timespan span)
{
    using ledger::EmployeeRole;

    std::map<std::pair<EmployeeId, EmployeeRole>, WorkerStats> stats;
    auto credit = [&](EmployeeId employeeId, EmployeeRole capacity, decimal_t total) {
        auto [it, inserted] = stats.try_emplace({employeeId, capacity});
        auto& row = it->second;
        if (inserted) {
            row.employeeId = employeeId;
            row.capacity = capacity;
            row.fullName = store.employee(employeeId)
                .transform([](const auto& employee) { return employee.fullName; })
                .value_or(fmt::format("#{}", employeeId));
        }
        ++row.orderCount;
        row.total += total;
    };

    for (const auto& order : ordersCompletedIn(store, span)) {
        if (order.courierId.has_value()) {
            credit(order.courierId.value(), EmployeeRole::COURIER, order.total);
        } else if (order.waiterId.has_value()) {
            credit(order.waiterId.value(), EmployeeRole::WAITER, order.total);
        }
    }

    WorkerReport report{.span = span};
    report.rows.reserve(stats.size());
    for (auto& row : stats | views::values) {
        row.averageCheck = util::round(
            row.total / decimal_t{row.orderCount}, store.decimalPlaces());
        report.rows.push_back(std::move(row));
    }
    ranges::stable_sort(report.rows, std::greater{}, &WorkerStats::total);

    return report;
}

//-------------------------------------------------------------------------

void CashFlowReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    static constexpr auto encoding = json::DecimalEncoding::DOUBLE;

    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        setSpanMembers(json, span);
        json::setDecimalMember(json, "cashRevenue", cashRevenue, encoding);
        json::setDecimalMember(json, "cardRevenue", cardRevenue, encoding);
        json::setDecimalMember(json, "totalRevenue", totalRevenue, encoding);
        json::setDecimalMember(json, "totalDeposits", totalDeposits, encoding);
        json::setDecimalMember(json, "totalExpenses", totalExpenses, encoding);
        json::setDecimalMember(json, "totalHandovers", totalHandovers, encoding);
        rapidjson::Value entriesJson{rapidjson::kArrayType};
        for (const auto& entry : entries) {
            rapidjson::Document entryJson{&allocator};
            entry.transaction.jsonSerialize(entryJson);
            entryJson.AddMember(
                "employee", rapidjson::Value{entry.employeeName.c_str(), allocator}, allocator);
            entriesJson.PushBack(entryJson, allocator);
        }
        json.AddMember("transactions", entriesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void WorkerReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    static constexpr auto encoding = json::DecimalEncoding::DOUBLE;

    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        setSpanMembers(json, span);
        rapidjson::Value rowsJson{rapidjson::kArrayType};
        for (const auto& row : rows) {
            rapidjson::Document rowJson{&allocator};
            rowJson.SetObject();
            rowJson.AddMember("employeeId", rapidjson::Value{row.employeeId}, allocator);
            rowJson.AddMember(
                "fullName", rapidjson::Value{row.fullName.c_str(), allocator}, allocator);
            rowJson.AddMember(
                "capacity",
                rapidjson::Value{magic_enum::enum_name(row.capacity).data(), allocator},
                allocator);
            rowJson.AddMember("orderCount", rapidjson::Value{row.orderCount}, allocator);
            json::setDecimalMember(rowJson, "total", row.total, encoding);
            json::setDecimalMember(rowJson, "averageCheck", row.averageCheck, encoding);
            rowsJson.PushBack(rowJson, allocator);
        }
        json.AddMember("rows", rowsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::report

//-------------------------------------------------------------------------
