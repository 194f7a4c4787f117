/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/StatisticsEngine.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] decimal_t sumTotals(auto&& orders)
{
    return ranges::accumulate(
        orders | views::transform(&ledger::OrderRecord::total), decimal_t{});
}

[[nodiscard]] decimal_t sumOfKind(
    const std::vector<ledger::Transaction>& transactions, ledger::TransactionKind kind)
{
    return ranges::accumulate(
        transactions
        | views::filter([kind](const auto& tx) { return tx.kind == kind; })
        | views::transform(&ledger::Transaction::amount),
        decimal_t{});
}

}  // namespace

//-------------------------------------------------------------------------

StatisticsEngine::StatisticsEngine(const LedgerContext& ctx) noexcept
    : m_ctx{ctx}
{}

//-------------------------------------------------------------------------

report::ShiftReport StatisticsEngine::compute(ShiftId shiftId) const
{
    auto snapshot = m_ctx.store->shiftSnapshot(shiftId);
    if (!snapshot.has_value()) {
        ledger::throwShiftNotFound(shiftId);
    }
    return compute(snapshot.value());
}

//-------------------------------------------------------------------------

report::ShiftReport StatisticsEngine::compute(const store::ShiftSnapshot& snapshot)
{
    using ledger::TransactionKind;

    const auto& [shift, orders, transactions] = snapshot;

    report::ShiftReport report{
        .shiftId = shift.id,
        .employeeId = shift.employeeId,
        .startTime = shift.startTime,
        .endTime = shift.endTime,
        .startCash = shift.startCash,
        .endCashActual = shift.endCashActual,
        .final = shift.closed
    };

    auto cashOrders = orders | views::filter(&ledger::OrderRecord::isCash);
    auto cardOrders = orders | views::filter([](const auto& order) { return !order.isCash(); });

    report.salesCash = sumTotals(cashOrders);
    report.salesCard = sumTotals(cardOrders);
    report.totalSales = report.salesCash + report.salesCard;

    report.serviceIn = sumOfKind(transactions, TransactionKind::MANUAL_IN);
    report.serviceOut = sumOfKind(transactions, TransactionKind::MANUAL_OUT);
    report.handoverIn = sumOfKind(transactions, TransactionKind::HANDOVER_IN);

    // Direct desk sales and handed-over orders alike end up linked and turned
    // in, so each collected order is counted exactly once.
    report.collectedCashOrders = sumTotals(
        cashOrders | views::filter(&ledger::OrderRecord::turnedIn));

    report.theoreticalCash =
        report.startCash + report.collectedCashOrders + report.serviceIn - report.serviceOut;

    if (report.endCashActual.has_value()) {
        report.discrepancy = report.endCashActual.value() - report.theoreticalCash;
    }

    return report;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
