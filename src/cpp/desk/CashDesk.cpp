/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/CashDesk.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

CashDesk::CashDesk(
    CashDeskConfig config, std::shared_ptr<spdlog::logger> logger, Clock clock)
    : CashDesk{
        std::make_unique<store::LedgerStore>(config.amountDecimals),
        std::move(config),
        std::move(logger),
        std::move(clock)}
{}

//-------------------------------------------------------------------------

CashDesk::CashDesk(
    std::unique_ptr<store::LedgerStore> store,
    CashDeskConfig config,
    std::shared_ptr<spdlog::logger> logger,
    Clock clock)
    : m_config{std::move(config)},
      m_store{std::move(store)},
      m_ctx{
          .store = m_store.get(),
          .signals = &m_signals,
          .logger = std::move(logger),
          .clock = std::move(clock),
          .fallbackPolicy = m_config.fallbackShift
      },
      m_statistics{m_ctx},
      m_shifts{m_ctx, m_statistics},
      m_transactions{m_ctx},
      m_debts{m_ctx},
      m_linker{m_ctx},
      m_handovers{m_ctx, m_debts, m_transactions},
      m_completions{m_ctx, m_linker, m_debts}
{
    if (!m_config.journalPath.empty()) {
        m_journal = std::make_unique<LedgerJournal>(
            m_config.journalPath, m_config.tenant, m_signals, m_ctx.clock);
    }
    if (!m_config.reportDestination.empty()) {
        m_archive = std::make_unique<ZReportArchive>(
            m_config.reportDestination, m_config.tenant, m_signals, m_ctx.logger);
    }
}

//-------------------------------------------------------------------------

ledger::Shift CashDesk::openShift(EmployeeId employeeId, decimal_t startCash)
{
    return m_shifts.open(employeeId, startCash);
}

//-------------------------------------------------------------------------

report::ShiftReport CashDesk::closeShift(ShiftId shiftId, decimal_t endCashActual)
{
    return m_shifts.close(shiftId, endCashActual);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> CashDesk::getOpenShift(EmployeeId employeeId) const
{
    return m_shifts.openShiftOf(employeeId);
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> CashDesk::getAnyOpenShift() const
{
    return m_shifts.anyOpenShift();
}

//-------------------------------------------------------------------------

std::optional<ledger::Shift> CashDesk::getShift(ShiftId shiftId) const
{
    return m_shifts.get(shiftId);
}

//-------------------------------------------------------------------------

std::vector<ledger::Shift> CashDesk::listShifts(std::optional<EmployeeId> employeeId) const
{
    return m_shifts.list(employeeId);
}

//-------------------------------------------------------------------------

ledger::Transaction CashDesk::recordTransaction(
    ShiftId shiftId, decimal_t amount, ledger::TransactionKind kind, std::string comment)
{
    return m_transactions.record(shiftId, amount, kind, std::move(comment));
}

//-------------------------------------------------------------------------

ledger::Transaction CashDesk::deposit(ShiftId shiftId, decimal_t amount, std::string comment)
{
    return m_transactions.deposit(shiftId, amount, std::move(comment));
}

//-------------------------------------------------------------------------

ledger::Transaction CashDesk::withdraw(ShiftId shiftId, decimal_t amount, std::string comment)
{
    return m_transactions.withdraw(shiftId, amount, std::move(comment));
}

//-------------------------------------------------------------------------

std::vector<ledger::Transaction> CashDesk::transactionsForShift(ShiftId shiftId) const
{
    return m_transactions.forShift(shiftId);
}

//-------------------------------------------------------------------------

service::CompletionOutcome CashDesk::onOrderCompleted(
    OrderId orderId, std::optional<EmployeeId> actingEmployeeId)
{
    return m_completions.onOrderCompleted(orderId, actingEmployeeId);
}

//-------------------------------------------------------------------------

std::optional<ShiftId> CashDesk::linkOrderToShift(
    OrderId orderId, std::optional<EmployeeId> preferredEmployeeId)
{
    return m_linker.link(orderId, preferredEmployeeId);
}

//-------------------------------------------------------------------------

std::optional<service::DebtEntry> CashDesk::registerDebt(OrderId orderId, EmployeeId employeeId)
{
    return m_debts.registerDebt(orderId, employeeId);
}

//-------------------------------------------------------------------------

decimal_t CashDesk::processHandover(
    ShiftId cashierShiftId, EmployeeId employeeId, std::span<const OrderId> orderIds)
{
    return m_handovers.process(cashierShiftId, employeeId, orderIds);
}

//-------------------------------------------------------------------------

decimal_t CashDesk::balanceOf(EmployeeId employeeId) const
{
    return m_debts.balance(employeeId);
}

//-------------------------------------------------------------------------

std::vector<ledger::Employee> CashDesk::debtors() const
{
    return m_debts.debtors();
}

//-------------------------------------------------------------------------

std::vector<ledger::OrderRecord> CashDesk::outstandingOrders(EmployeeId employeeId) const
{
    return m_debts.outstandingOrders(employeeId);
}

//-------------------------------------------------------------------------

report::ShiftReport CashDesk::computeShiftStatistics(ShiftId shiftId) const
{
    return m_statistics.compute(shiftId);
}

//-------------------------------------------------------------------------

report::CashFlowReport CashDesk::cashFlowReport(Timespan span) const
{
    return report::makeCashFlowReport(*m_store, span);
}

//-------------------------------------------------------------------------

report::WorkerReport CashDesk::workerReport(Timespan span) const
{
    return report::makeWorkerReport(*m_store, span);
}

//-------------------------------------------------------------------------

void CashDesk::putEmployee(ledger::Employee employee)
{
    m_store->putEmployee(std::move(employee));
}

//-------------------------------------------------------------------------

void CashDesk::putOrder(ledger::OrderRecord order)
{
    m_store->putOrder(std::move(order));
}

//-------------------------------------------------------------------------

void CashDesk::saveCheckpoint(const fs::path& path) const
{
    json::saveCheckpointFile(*m_store, path);
    m_ctx.logger->debug("Checkpoint saved to '{}'", path.c_str());
}

//-------------------------------------------------------------------------

std::unique_ptr<CashDesk> CashDesk::fromCheckpoint(
    const fs::path& path,
    CashDeskConfig config,
    std::shared_ptr<spdlog::logger> logger,
    Clock clock)
{
    auto store = store::LedgerStore::fromJson(json::loadJson(path));
    if (store->decimalPlaces() != config.amountDecimals) {
        throw std::invalid_argument{fmt::format(
            "{}: Checkpoint '{}' keeps {} decimals, config asks for {}",
            std::source_location::current().function_name(),
            path.c_str(),
            store->decimalPlaces(),
            config.amountDecimals)};
    }
    return std::unique_ptr<CashDesk>{new CashDesk{
        std::move(store), std::move(config), std::move(logger), std::move(clock)}};
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
