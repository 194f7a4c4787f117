/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/service/DebtLedger.hpp"

#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::service
{

//-------------------------------------------------------------------------

DebtLedger::DebtLedger(const LedgerContext& ctx) noexcept
    : m_ctx{ctx}
{}

//-------------------------------------------------------------------------

std::optional<DebtEntry> DebtLedger::registerDebt(OrderId orderId, EmployeeId employeeId)
{
    store::UnitOfWork uow{*m_ctx.store};
    auto entry = stageDebt(uow, orderId, employeeId);
    if (!entry.has_value()) return std::nullopt;
    uow.commit();
    m_ctx.signals->debtRegistered(entry.value());
    return entry;
}

//-------------------------------------------------------------------------

std::optional<DebtEntry> DebtLedger::stageDebt(
    store::UnitOfWork& uow, OrderId orderId, EmployeeId employeeId) const
{
    uow.acquire({store::LockKey::order(orderId), store::LockKey::employee(employeeId)});

    auto order = uow.order(orderId);
    if (!order.has_value()) {
        m_ctx.logger->error("Cannot register debt: order #{} not found", orderId);
        return std::nullopt;
    }
    if (!order->isCash()) return std::nullopt;

    auto employee = uow.employee(employeeId);
    if (!employee.has_value()) {
        m_ctx.logger->error(
            "Cannot register debt for order #{}: employee #{} not found", orderId, employeeId);
        return std::nullopt;
    }

    employee->cashBalance = util::clampNonNegative(employee->cashBalance + order->total);
    order->turnedIn = false;
    order->debtHolderId = employeeId;
    uow.updateEmployee(employee.value());
    uow.updateOrder(order.value());

    m_ctx.logger->info(
        "{} collected {} for order #{}, now holding {}",
        employee.value(), order->total, orderId, employee->cashBalance);

    return DebtEntry{
        .orderId = orderId,
        .employeeId = employeeId,
        .amount = order->total,
        .balance = employee->cashBalance
    };
}

//-------------------------------------------------------------------------

decimal_t DebtLedger::settle(store::UnitOfWork& uow, EmployeeId employeeId, decimal_t amount) const
{
    auto employee = uow.employee(employeeId);
    if (!employee.has_value()) {
        ledger::throwEmployeeNotFound(employeeId);
    }
    if (amount > employee->cashBalance) {
        m_ctx.logger->warn(
            "{} hands over {} while holding only {}, balance clamped to zero",
            employee.value(), amount, employee->cashBalance);
    }
    employee->cashBalance = util::clampNonNegative(employee->cashBalance - amount);
    uow.updateEmployee(employee.value());
    return employee->cashBalance;
}

//-------------------------------------------------------------------------

decimal_t DebtLedger::balance(EmployeeId employeeId) const
{
    const auto employee = m_ctx.store->employee(employeeId);
    if (!employee.has_value()) {
        ledger::throwEmployeeNotFound(employeeId);
    }
    return employee->cashBalance;
}

//-------------------------------------------------------------------------

std::vector<ledger::Employee> DebtLedger::debtors() const
{
    const auto employees = m_ctx.store->employees();
    return employees
        | views::filter([](const auto& employee) { return employee.cashBalance > 0_dec; })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

std::vector<ledger::OrderRecord> DebtLedger::outstandingOrders(EmployeeId employeeId) const
{
    const auto orders = m_ctx.store->orders();
    return orders
        | views::filter([employeeId](const auto& order) {
            return order.isCash()
                && !order.turnedIn
                && order.debtHolderId == employeeId;
        })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::service

//-------------------------------------------------------------------------
