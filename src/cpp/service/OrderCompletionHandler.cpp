/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/OrderCompletionHandler.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

OrderCompletionHandler::OrderCompletionHandler(
    const LedgerContext& ctx,
    const OrderShiftLinker& linker,
    const DebtLedger& debts) noexcept
    : m_ctx{ctx}, m_linker{linker}, m_debts{debts}
{}

//-------------------------------------------------------------------------

CompletionOutcome OrderCompletionHandler::onOrderCompleted(
    OrderId orderId, std::optional<EmployeeId> actingEmployeeId)
{
    store::UnitOfWork uow{*m_ctx.store};
    uow.acquire(store::LockKey::order(orderId));

    auto order = uow.order(orderId);
    if (!order.has_value()) {
        ledger::throwOrderNotFound(orderId);
    }
    const bool wasLinked = order->linkedShiftId.has_value();
    const bool firstCompletion = !order->completedAt.has_value();
    const auto collector = order->isCash() && firstCompletion
        ? order->cashCollector()
        : std::nullopt;
    if (collector.has_value()) {
        uow.acquire(store::LockKey::employee(collector.value()));
    }

    if (firstCompletion) {
        order->completedAt = m_ctx.clock();
        uow.updateOrder(order.value());
    }

    CompletionOutcome outcome{
        .orderId = orderId,
        .linkedShiftId = m_linker.stageLink(uow, orderId, actingEmployeeId),
        .custody = CashCustody::UNCHANGED
    };

    std::optional<DebtEntry> debt;
    if (!order->isCash()) {
        outcome.custody = CashCustody::NOT_CASH;
    } else if (!firstCompletion) {
        m_ctx.logger->debug("Order #{} completed again, cash already accounted for", orderId);
    } else if (collector.has_value()) {
        debt = m_debts.stageDebt(uow, orderId, collector.value());
        if (debt.has_value()) {
            outcome.custody = CashCustody::EMPLOYEE_DEBT;
            outcome.debtorId = collector;
        }
    } else {
        // Nobody carried the money: it was taken at the desk.
        auto staged = uow.order(orderId).value();
        staged.turnedIn = true;
        uow.updateOrder(staged);
        outcome.custody = CashCustody::DRAWER;
    }

    uow.commit();

    if (!outcome.linkedShiftId.has_value()) {
        m_ctx.signals->orderUnlinked(orderId);
    } else if (!wasLinked) {
        m_ctx.signals->orderLinked(orderId, outcome.linkedShiftId.value());
    }
    if (debt.has_value()) {
        m_ctx.signals->debtRegistered(debt.value());
    }

    return outcome;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
