/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/service/LedgerContext.hpp"
#include "cashdesk/store/UnitOfWork.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

/**
 * Attributes a completed order to exactly one shift. The preferred
 * employee's open shift wins, any open shift is the fallback. An order
 * completed while no shift is open anywhere stays unlinked for good; that
 * is logged, not raised.
 */
class OrderShiftLinker
{
public:
    explicit OrderShiftLinker(const LedgerContext& ctx) noexcept;

    /**
     * Idempotent: an already linked order keeps its shift.
     *
     * @returns the shift the order is linked to, if any.
     * @throws ledger::LedgerError with ORDER_NOT_FOUND.
     */
    std::optional<ShiftId> link(OrderId orderId, std::optional<EmployeeId> preferredEmployeeId);

    // Takes the order lock and the target shift's lock in the caller's unit of work.
    std::optional<ShiftId> stageLink(
        store::UnitOfWork& uow,
        OrderId orderId,
        std::optional<EmployeeId> preferredEmployeeId) const;

private:
    const LedgerContext& m_ctx;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
