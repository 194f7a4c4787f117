/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/CashDesk.hpp"
#include "cashdesk/desk/logging.hpp"
#include "cashdesk/ledger/LedgerError.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>
#include <date/date.h>

#include <sstream>

//-------------------------------------------------------------------------

using namespace cashdesk;

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] decimal_t parseAmount(const std::string& str)
{
    auto amount = util::parseDecimal(str);
    if (!amount.has_value()) {
        throw CLI::ValidationError{fmt::format("'{}' is not a decimal amount", str)};
    }
    return amount.value();
}

[[nodiscard]] Timestamp parseDay(const std::string& str, bool endOfDay)
{
    std::istringstream in{str};
    date::sys_days day;
    date::from_stream(in, "%Y-%m-%d", day);
    if (in.fail()) {
        throw CLI::ValidationError{fmt::format("'{}' is not a YYYY-MM-DD date", str)};
    }
    using namespace std::chrono;
    const auto start = duration_cast<milliseconds>(day.time_since_epoch());
    const auto stamp = endOfDay ? start + duration_cast<milliseconds>(days{1}) - 1ms : start;
    return static_cast<Timestamp>(stamp.count());
}

void printJson(const auto& serializable)
{
    fmt::print(
        "{}\n",
        json::jsonSerializable2str(
            serializable, {.indent = json::IndentOptions{}, .decimals = 2}));
}

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"cashdesk - cash-shift ledger"};
    app.require_subcommand(1);

    fs::path statePath;
    app.add_option("-s,--state", statePath, "Ledger checkpoint file")->required();

    fs::path configPath;
    app.add_option("-f,--config-file", configPath, "CashDesk XML config")
        ->check(CLI::ExistingFile);

    // init
    auto* initCmd = app.add_subcommand("init", "Create an empty ledger");

    // add-employee
    auto* addEmployeeCmd = app.add_subcommand("add-employee", "Register or rename an employee");
    EmployeeId employeeId{};
    std::string fullName;
    std::string role = "cashier";
    addEmployeeCmd->add_option("--id", employeeId)->required();
    addEmployeeCmd->add_option("--name", fullName)->required();
    addEmployeeCmd->add_option("--role", role, "cashier|operator|courier|waiter");

    // add-order
    auto* addOrderCmd = app.add_subcommand("add-order", "Register or update an order");
    OrderId orderId{};
    std::string payment = "cash";
    std::string totalStr;
    std::optional<EmployeeId> courierId, waiterId;
    addOrderCmd->add_option("--id", orderId)->required();
    addOrderCmd->add_option("--payment", payment, "cash|card");
    addOrderCmd->add_option("--total", totalStr)->required();
    addOrderCmd->add_option("--courier", courierId);
    addOrderCmd->add_option("--waiter", waiterId);

    // complete-order
    auto* completeCmd = app.add_subcommand("complete-order", "Order reached a completed status");
    std::optional<EmployeeId> actingEmployeeId;
    completeCmd->add_option("--id", orderId)->required();
    completeCmd->add_option("--by", actingEmployeeId, "Employee who completed it");

    // open-shift
    auto* openCmd = app.add_subcommand("open-shift", "Open a cash-register shift");
    std::string amountStr = "0";
    openCmd->add_option("--employee", employeeId)->required();
    openCmd->add_option("--start-cash", amountStr);

    // close-shift
    auto* closeCmd = app.add_subcommand("close-shift", "Close a shift and print its Z-report");
    ShiftId shiftId{};
    closeCmd->add_option("--shift", shiftId)->required();
    closeCmd->add_option("--end-cash", amountStr)->required();

    // deposit / withdraw
    std::string comment;
    auto* depositCmd = app.add_subcommand("deposit", "Put cash into a drawer");
    auto* withdrawCmd = app.add_subcommand("withdraw", "Take cash out of a drawer");
    for (auto* cmd : {depositCmd, withdrawCmd}) {
        cmd->add_option("--shift", shiftId)->required();
        cmd->add_option("--amount", amountStr)->required();
        cmd->add_option("--comment", comment);
    }

    // handover
    auto* handoverCmd = app.add_subcommand("handover", "Accept cash collected by an employee");
    std::vector<OrderId> orderIds;
    handoverCmd->add_option("--shift", shiftId, "Cashier's shift")->required();
    handoverCmd->add_option("--employee", employeeId)->required();
    handoverCmd->add_option("--orders", orderIds)->delimiter(',')->required();

    // report
    auto* reportCmd = app.add_subcommand("report", "X-report of a shift");
    reportCmd->add_option("--shift", shiftId)->required();

    // debts
    auto* debtsCmd = app.add_subcommand("debts", "Employees holding cash, or one's open orders");
    std::optional<EmployeeId> debtorId;
    debtsCmd->add_option("--employee", debtorId);

    // cash-flow / workers
    std::string fromStr, toStr;
    auto* cashFlowCmd = app.add_subcommand("cash-flow", "Revenue and drawer movements of a period");
    auto* workersCmd = app.add_subcommand("workers", "Courier and waiter performance of a period");
    for (auto* cmd : {cashFlowCmd, workersCmd}) {
        cmd->add_option("--from", fromStr, "YYYY-MM-DD")->required();
        cmd->add_option("--to", toStr, "YYYY-MM-DD")->required();
    }

    CLI11_PARSE(app, argc, argv);

    desk::CashDeskConfig config;
    try {
        if (!configPath.empty()) {
            config = desk::loadCashDeskConfig(configPath);
        }
    }
    catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }
    auto logger = desk::makeConsoleLogger("cashdesk", config.logLevel);

    try {
        if (initCmd->parsed()) {
            if (fs::exists(statePath)) {
                throw std::invalid_argument{fmt::format(
                    "Refusing to overwrite existing ledger '{}'", statePath.c_str())};
            }
            desk::CashDesk{config, logger}.saveCheckpoint(statePath);
            logger->info("Initialized empty ledger at '{}'", statePath.c_str());
            return 0;
        }

        auto cashDesk = desk::CashDesk::fromCheckpoint(statePath, config, logger);

        if (addEmployeeCmd->parsed()) {
            cashDesk->putEmployee(ledger::Employee{
                .id = employeeId,
                .fullName = fullName,
                .role = ledger::enumFromString<ledger::EmployeeRole>(role)
            });
        }
        else if (addOrderCmd->parsed()) {
            cashDesk->putOrder(ledger::OrderRecord{
                .id = orderId,
                .paymentMethod = ledger::enumFromString<ledger::PaymentMethod>(payment),
                .total = parseAmount(totalStr),
                .courierId = courierId,
                .waiterId = waiterId
            });
        }
        else if (completeCmd->parsed()) {
            const auto outcome = cashDesk->onOrderCompleted(orderId, actingEmployeeId);
            fmt::print(
                "order #{}: shift {}, cash {}\n",
                orderId,
                outcome.linkedShiftId.transform([](ShiftId id) { return fmt::format("#{}", id); })
                    .value_or("none"),
                magic_enum::enum_name(outcome.custody));
        }
        else if (openCmd->parsed()) {
            const auto shift = cashDesk->openShift(employeeId, parseAmount(amountStr));
            fmt::print("{}\n", json::jsonSerializable2str(shift));
        }
        else if (closeCmd->parsed()) {
            printJson(cashDesk->closeShift(shiftId, parseAmount(amountStr)));
        }
        else if (depositCmd->parsed()) {
            fmt::print("{}\n", cashDesk->deposit(shiftId, parseAmount(amountStr), comment));
        }
        else if (withdrawCmd->parsed()) {
            fmt::print("{}\n", cashDesk->withdraw(shiftId, parseAmount(amountStr), comment));
        }
        else if (handoverCmd->parsed()) {
            fmt::print("{}\n", cashDesk->processHandover(shiftId, employeeId, orderIds));
        }
        else if (reportCmd->parsed()) {
            printJson(cashDesk->computeShiftStatistics(shiftId));
        }
        else if (debtsCmd->parsed()) {
            if (debtorId.has_value()) {
                for (const auto& order : cashDesk->outstandingOrders(debtorId.value())) {
                    fmt::print("order #{}: {}\n", order.id, order.total);
                }
            } else {
                for (const auto& employee : cashDesk->debtors()) {
                    fmt::print("{}: {}\n", employee, employee.cashBalance);
                }
            }
        }
        else if (cashFlowCmd->parsed()) {
            printJson(cashDesk->cashFlowReport(
                {.begin = parseDay(fromStr, false), .end = parseDay(toStr, true)}));
        }
        else if (workersCmd->parsed()) {
            printJson(cashDesk->workerReport(
                {.begin = parseDay(fromStr, false), .end = parseDay(toStr, true)}));
        }

        cashDesk->saveCheckpoint(statePath);
    }
    catch (const ledger::LedgerError& e) {
        logger->error("{} ({})", e.what(), magic_enum::enum_name(e.code()));
        return 2;
    }
    catch (const CLI::ValidationError& e) {
        logger->error("{}", e.what());
        return 1;
    }
    catch (const std::invalid_argument& e) {
        logger->error("{}", e.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
