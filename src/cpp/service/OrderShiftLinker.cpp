/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/OrderShiftLinker.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

OrderShiftLinker::OrderShiftLinker(const LedgerContext& ctx) noexcept
    : m_ctx{ctx}
{}

//-------------------------------------------------------------------------

std::optional<ShiftId> OrderShiftLinker::link(
    OrderId orderId, std::optional<EmployeeId> preferredEmployeeId)
{
    store::UnitOfWork uow{*m_ctx.store};
    uow.acquire(store::LockKey::order(orderId));
    const bool wasLinked = [&] {
        const auto order = uow.order(orderId);
        return order.has_value() && order->linkedShiftId.has_value();
    }();

    const auto shiftId = stageLink(uow, orderId, preferredEmployeeId);
    uow.commit();

    if (!shiftId.has_value()) {
        m_ctx.signals->orderUnlinked(orderId);
    } else if (!wasLinked) {
        m_ctx.signals->orderLinked(orderId, shiftId.value());
    }
    return shiftId;
}

//-------------------------------------------------------------------------

std::optional<ShiftId> OrderShiftLinker::stageLink(
    store::UnitOfWork& uow,
    OrderId orderId,
    std::optional<EmployeeId> preferredEmployeeId) const
{
    uow.acquire(store::LockKey::order(orderId));

    auto order = uow.order(orderId);
    if (!order.has_value()) {
        ledger::throwOrderNotFound(orderId);
    }
    if (order->linkedShiftId.has_value()) {
        return order->linkedShiftId;
    }

    // The candidate is looked up without its lock, so it may close before the
    // lock is granted; in that case look again.
    for (;;) {
        std::optional<ledger::Shift> candidate;
        if (preferredEmployeeId.has_value()) {
            candidate = uow.openShiftOf(preferredEmployeeId.value());
        }
        if (!candidate.has_value()) {
            candidate = uow.anyOpenShift(m_ctx.fallbackPolicy);
        }
        if (!candidate.has_value()) {
            m_ctx.logger->warn(
                "Order #{} is not linked to any shift: no shift is open", orderId);
            return std::nullopt;
        }

        const auto key = store::LockKey::shift(candidate->id);
        const bool alreadyHeld = uow.holds(key);
        uow.acquire(key);
        const auto current = uow.shift(candidate->id);
        if (current.has_value() && current->isOpen()) {
            order->linkedShiftId = current->id;
            uow.updateOrder(order.value());
            m_ctx.logger->info("Order #{} linked to shift #{}", orderId, current->id);
            return current->id;
        }
        if (!alreadyHeld) {
            uow.release(key);
        }
    }
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
