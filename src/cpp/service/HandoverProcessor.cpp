/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/HandoverProcessor.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

HandoverProcessor::HandoverProcessor(
    const LedgerContext& ctx,
    const DebtLedger& debts,
    const TransactionLog& transactions) noexcept
    : m_ctx{ctx}, m_debts{debts}, m_transactions{transactions}
{}

//-------------------------------------------------------------------------

decimal_t HandoverProcessor::process(
    ShiftId cashierShiftId, EmployeeId employeeId, std::span<const OrderId> orderIds)
{
    using ledger::ErrorCode;
    using ledger::LedgerError;

    store::UnitOfWork uow{*m_ctx.store};

    std::vector<store::LockKey> keys = orderIds
        | views::transform([](OrderId orderId) { return store::LockKey::order(orderId); })
        | ranges::to<std::vector>;
    keys.push_back(store::LockKey::employee(employeeId));
    keys.push_back(store::LockKey::shift(cashierShiftId));
    uow.acquire(std::move(keys));

    const auto shift = uow.shift(cashierShiftId);
    if (!shift.has_value()) {
        ledger::throwShiftNotFound(cashierShiftId);
    }
    if (shift->closed) {
        throw LedgerError{
            ErrorCode::SHIFT_CLOSED,
            fmt::format("Shift #{} is closed and cannot receive a handover", cashierShiftId)};
    }

    const auto employee = uow.employee(employeeId);
    if (!employee.has_value()) {
        ledger::throwEmployeeNotFound(employeeId);
    }

    std::vector<OrderId> requested{orderIds.begin(), orderIds.end()};
    ranges::sort(requested);
    requested.erase(ranges::unique(requested), requested.end());

    std::vector<ledger::OrderRecord> selected;
    for (OrderId orderId : requested) {
        auto order = uow.order(orderId);
        if (order.has_value() && order->isCash() && !order->turnedIn) {
            selected.push_back(std::move(order).value());
        }
    }
    if (selected.empty()) {
        throw LedgerError{
            ErrorCode::NO_ELIGIBLE_ORDERS,
            fmt::format(
                "None of the orders [{}] awaits a handover", fmt::join(orderIds, ", "))};
    }

    const decimal_t amount = ranges::accumulate(
        selected | views::transform(&ledger::OrderRecord::total), decimal_t{});

    for (auto& order : selected) {
        order.turnedIn = true;
        if (!order.linkedShiftId.has_value()) {
            order.linkedShiftId = cashierShiftId;
        }
        uow.updateOrder(order);
    }

    const decimal_t balance = m_debts.settle(uow, employeeId, amount);

    const auto selectedIds = selected
        | views::transform(&ledger::OrderRecord::id)
        | ranges::to<std::vector>;

    // Zero-total orders settle the flags but leave nothing to put in the drawer.
    if (amount > 0_dec) {
        m_transactions.stage(
            uow,
            cashierShiftId,
            amount,
            ledger::TransactionKind::HANDOVER_IN,
            fmt::format(
                "Handover from {} (orders: {})", employee->fullName, fmt::join(selectedIds, ", ")));
    }

    auto stored = uow.commit();

    m_ctx.logger->info(
        "Shift #{} received {} from {} for orders [{}], remaining balance {}",
        cashierShiftId, amount, employee.value(), fmt::join(selectedIds, ", "), balance);

    HandoverReceipt receipt{
        .shiftId = cashierShiftId,
        .employeeId = employeeId,
        .orderIds = selectedIds,
        .amount = amount,
        .balance = balance,
        .transaction = stored.empty()
            ? std::nullopt
            : std::make_optional(stored.front())
    };
    if (receipt.transaction.has_value()) {
        m_ctx.signals->transactionRecorded(receipt.transaction.value());
    }
    m_ctx.signals->handoverProcessed(receipt);

    return amount;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
