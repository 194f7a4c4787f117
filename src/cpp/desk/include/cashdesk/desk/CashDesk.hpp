/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/desk/CashDeskConfig.hpp"
#include "cashdesk/desk/LedgerJournal.hpp"
#include "cashdesk/desk/ZReportArchive.hpp"
#include "cashdesk/report/PeriodReports.hpp"
#include "cashdesk/service/HandoverProcessor.hpp"
#include "cashdesk/service/OrderCompletionHandler.hpp"
#include "cashdesk/service/ShiftStore.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

/**
 * The cash-shift ledger as seen by admin panels and bot handlers. Owns the
 * store and wires the services, the signals and their listeners together.
 * All operations are safe to call concurrently.
 */
class CashDesk
{
public:
    CashDesk(
        CashDeskConfig config,
        std::shared_ptr<spdlog::logger> logger,
        Clock clock = currentTimestamp);

    CashDesk(const CashDesk&) = delete;
    CashDesk& operator=(const CashDesk&) = delete;

    // Shifts.
    ledger::Shift openShift(EmployeeId employeeId, decimal_t startCash);
    report::ShiftReport closeShift(ShiftId shiftId, decimal_t endCashActual);
    [[nodiscard]] std::optional<ledger::Shift> getOpenShift(EmployeeId employeeId) const;
    [[nodiscard]] std::optional<ledger::Shift> getAnyOpenShift() const;
    [[nodiscard]] std::optional<ledger::Shift> getShift(ShiftId shiftId) const;
    [[nodiscard]] std::vector<ledger::Shift> listShifts(
        std::optional<EmployeeId> employeeId = {}) const;

    // Drawer movements.
    ledger::Transaction recordTransaction(
        ShiftId shiftId, decimal_t amount, ledger::TransactionKind kind, std::string comment);
    ledger::Transaction deposit(ShiftId shiftId, decimal_t amount, std::string comment);
    ledger::Transaction withdraw(ShiftId shiftId, decimal_t amount, std::string comment);
    [[nodiscard]] std::vector<ledger::Transaction> transactionsForShift(ShiftId shiftId) const;

    // Orders and debts.
    service::CompletionOutcome onOrderCompleted(
        OrderId orderId, std::optional<EmployeeId> actingEmployeeId);
    std::optional<ShiftId> linkOrderToShift(
        OrderId orderId, std::optional<EmployeeId> preferredEmployeeId);
    std::optional<service::DebtEntry> registerDebt(OrderId orderId, EmployeeId employeeId);
    decimal_t processHandover(
        ShiftId cashierShiftId, EmployeeId employeeId, std::span<const OrderId> orderIds);
    [[nodiscard]] decimal_t balanceOf(EmployeeId employeeId) const;
    [[nodiscard]] std::vector<ledger::Employee> debtors() const;
    [[nodiscard]] std::vector<ledger::OrderRecord> outstandingOrders(EmployeeId employeeId) const;

    // Reporting.
    [[nodiscard]] report::ShiftReport computeShiftStatistics(ShiftId shiftId) const;
    [[nodiscard]] report::CashFlowReport cashFlowReport(Timespan span) const;
    [[nodiscard]] report::WorkerReport workerReport(Timespan span) const;

    // Rows owned by the employee and order subsystems.
    void putEmployee(ledger::Employee employee);
    void putOrder(ledger::OrderRecord order);

    void saveCheckpoint(const fs::path& path) const;

    /**
     * @throws std::invalid_argument if the checkpoint is unreadable or its
     *         precision disagrees with the config.
     */
    [[nodiscard]] static std::unique_ptr<CashDesk> fromCheckpoint(
        const fs::path& path,
        CashDeskConfig config,
        std::shared_ptr<spdlog::logger> logger,
        Clock clock = currentTimestamp);

    [[nodiscard]] const CashDeskConfig& config() const noexcept { return m_config; }
    [[nodiscard]] store::LedgerStore& store() noexcept { return *m_store; }
    [[nodiscard]] service::LedgerSignals& signals() noexcept { return m_signals; }

private:
    CashDesk(
        std::unique_ptr<store::LedgerStore> store,
        CashDeskConfig config,
        std::shared_ptr<spdlog::logger> logger,
        Clock clock);

    CashDeskConfig m_config;
    std::unique_ptr<store::LedgerStore> m_store;
    service::LedgerSignals m_signals;
    service::LedgerContext m_ctx;

    service::StatisticsEngine m_statistics;
    service::ShiftStore m_shifts;
    service::TransactionLog m_transactions;
    service::DebtLedger m_debts;
    service::OrderShiftLinker m_linker;
    service::HandoverProcessor m_handovers;
    service::OrderCompletionHandler m_completions;

    std::unique_ptr<LedgerJournal> m_journal;
    std::unique_ptr<ZReportArchive> m_archive;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
