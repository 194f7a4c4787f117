/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/LedgerJournal.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
[[nodiscard]] std::string optionalField(const std::optional<T>& value)
{
    return value.has_value() ? fmt::format("{}", value.value()) : std::string{};
}

// Free text goes last and is quoted, with embedded quotes doubled.
[[nodiscard]] std::string quoted(std::string_view text)
{
    std::string out{"\""};
    for (char c : text) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace

//-------------------------------------------------------------------------

LedgerJournal::LedgerJournal(
    const fs::path& filepath,
    std::string tenant,
    service::LedgerSignals& signals,
    Clock clock)
    : m_filepath{filepath}, m_tenant{std::move(tenant)}, m_clock{std::move(clock)}
{
    const bool fresh = !fs::exists(m_filepath) || fs::file_size(m_filepath) == 0;

    m_logger = std::make_unique<spdlog::logger>(
        "LedgerJournal", std::make_shared<spdlog::sinks::basic_file_sink_mt>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    if (fresh) {
        m_logger->trace("timestamp,tenant,event,shiftId,employeeId,orderId,amount,detail");
        m_logger->flush();
    }

    m_feeds.emplace_back(signals.shiftOpened.connect([this](const ledger::Shift& shift) {
        write({
            .event = "shift-opened",
            .shiftId = shift.id,
            .employeeId = shift.employeeId,
            .amount = shift.startCash
        });
    }));
    m_feeds.emplace_back(signals.shiftClosed.connect([this](const report::ShiftReport& report) {
        write({
            .event = "shift-closed",
            .shiftId = report.shiftId,
            .employeeId = report.employeeId,
            .amount = report.endCashActual,
            .detail = fmt::format(
                "theoretical {}, discrepancy {}",
                report.theoreticalCash,
                report.discrepancy.value_or(decimal_t{}))
        });
    }));
    m_feeds.emplace_back(signals.transactionRecorded.connect([this](const ledger::Transaction& tx) {
        write({
            .event = magic_enum::enum_name(tx.kind),
            .shiftId = tx.shiftId,
            .amount = tx.amount,
            .detail = tx.comment
        });
    }));
    m_feeds.emplace_back(signals.orderLinked.connect([this](OrderId orderId, ShiftId shiftId) {
        write({.event = "order-linked", .shiftId = shiftId, .orderId = orderId});
    }));
    m_feeds.emplace_back(signals.orderUnlinked.connect([this](OrderId orderId) {
        write({.event = "order-unlinked", .orderId = orderId, .detail = "no open shift"});
    }));
    m_feeds.emplace_back(signals.debtRegistered.connect([this](const service::DebtEntry& entry) {
        write({
            .event = "debt-registered",
            .employeeId = entry.employeeId,
            .orderId = entry.orderId,
            .amount = entry.amount,
            .detail = fmt::format("balance {}", entry.balance)
        });
    }));
    m_feeds.emplace_back(signals.handoverProcessed.connect(
        [this](const service::HandoverReceipt& receipt) {
            write({
                .event = "handover",
                .shiftId = receipt.shiftId,
                .employeeId = receipt.employeeId,
                .amount = receipt.amount,
                .detail = fmt::format(
                    "orders {}, balance {}", fmt::join(receipt.orderIds, " "), receipt.balance)
            });
        }));
}

//-------------------------------------------------------------------------

void LedgerJournal::write(const Line& line) const
{
    m_logger->trace(
        "{},{},{},{},{},{},{},{}",
        m_clock(),
        m_tenant,
        line.event,
        optionalField(line.shiftId),
        optionalField(line.employeeId),
        optionalField(line.orderId),
        optionalField(line.amount),
        quoted(line.detail));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
