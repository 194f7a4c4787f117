/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "test-common/LedgerFixture.hpp"

#include <fstream>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::test;
using namespace cashdesk::literals;

using namespace testing;

using ledger::PaymentMethod;

//-------------------------------------------------------------------------

namespace
{

fs::path scratchDirectory()
{
    const auto* info = UnitTest::GetInstance()->current_test_info();
    const fs::path dir = fs::temp_directory_path()
        / fmt::format("cashdesk-{}-{}", info->test_suite_name(), info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::string> readLines(const fs::path& path)
{
    std::ifstream ifs{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

struct CashDeskOutputsTest : LedgerFixture
{
    virtual void SetUp() override
    {
        dir = scratchDirectory();
        LedgerFixture::SetUp();
    }

    virtual void TearDown() override
    {
        cashDesk.reset();
        fs::remove_all(dir);
    }

    virtual desk::CashDeskConfig makeConfig() const override
    {
        return {
            .tenant = "bistro",
            .reportDestination = dir / "z",
            .journalPath = dir / "journal.csv"
        };
    }

    fs::path dir;
};

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, JournalRecordsEveryEvent)
{
    const auto shift = cashDesk->openShift(kCashier, 100_dec);
    addOrder(1, 150_dec, PaymentMethod::CASH, kCourier);
    cashDesk->onOrderCompleted(1, kCashier);
    const std::vector<OrderId> ids{1};
    cashDesk->processHandover(shift.id, kCourier, ids);
    cashDesk->withdraw(shift.id, 20_dec, "say \"cheese\"");
    cashDesk->closeShift(shift.id, 230_dec);

    const auto lines = readLines(dir / "journal.csv");

    ASSERT_THAT(lines, SizeIs(8));
    EXPECT_EQ(lines[0], "timestamp,tenant,event,shiftId,employeeId,orderId,amount,detail");
    EXPECT_THAT(lines[1], HasSubstr(",bistro,shift-opened,"));
    EXPECT_THAT(lines[2], HasSubstr(",order-linked,"));
    EXPECT_THAT(lines[3], HasSubstr(",debt-registered,,3,1,"));
    EXPECT_THAT(lines[4], HasSubstr(",HANDOVER_IN,"));
    EXPECT_THAT(lines[5], HasSubstr(",handover,"));
    EXPECT_THAT(lines[6], EndsWith(R"("say ""cheese""")"));
    EXPECT_THAT(lines[7], HasSubstr(",shift-closed,"));
}

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, JournalHeaderIsWrittenOnce)
{
    cashDesk->openShift(kCashier, 0_dec);
    cashDesk.reset();
    cashDesk = std::make_unique<desk::CashDesk>(makeConfig(), desk::makeNullLogger("test"));
    cashDesk->putEmployee({.id = kOperator, .fullName = "Taras", .role = ledger::EmployeeRole::OPERATOR});
    cashDesk->openShift(kOperator, 0_dec);

    const auto lines = readLines(dir / "journal.csv");
    EXPECT_THAT(lines, SizeIs(3));
    EXPECT_EQ(
        ranges::count(lines, "timestamp,tenant,event,shiftId,employeeId,orderId,amount,detail"),
        1);
}

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, ClosingArchivesZReport)
{
    const auto shift = cashDesk->openShift(kCashier, 100_dec);
    cashDesk->deposit(shift.id, 50_dec, "");
    cashDesk->closeShift(shift.id, 140_dec);

    const fs::path path = dir / "z" / fmt::format("bistro-z-{}.json", shift.id);
    ASSERT_TRUE(fs::exists(path));

    const auto json = json::loadJson(path);
    EXPECT_STREQ(json["type"].GetString(), "Z");
    EXPECT_STREQ(json["tenant"].GetString(), "bistro");
    EXPECT_EQ(json["shiftId"].GetUint(), shift.id);
    EXPECT_DOUBLE_EQ(json["theoreticalCash"].GetDouble(), 150.0);
    EXPECT_DOUBLE_EQ(json["discrepancy"].GetDouble(), -10.0);

    EXPECT_EQ(std::distance(fs::directory_iterator{dir / "z"}, fs::directory_iterator{}), 1);
}

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, UnwritableArchiveDoesNotFailClose)
{
    const auto shift = cashDesk->openShift(kCashier, 100_dec);
    fs::remove_all(dir / "z");
    std::ofstream{dir / "z"} << "not a directory";

    const auto report = cashDesk->closeShift(shift.id, 100_dec);

    EXPECT_EQ(report.shiftId, shift.id);
    EXPECT_FALSE(cashDesk->getShift(shift.id)->isOpen());
}

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, CheckpointRestoresLedger)
{
    const auto shift = cashDesk->openShift(kCashier, 100_dec);
    addOrder(1, DEC(150.55), PaymentMethod::CASH, kCourier);
    cashDesk->onOrderCompleted(1, kCashier);
    cashDesk->deposit(shift.id, DEC(0.45), "coins");
    const auto before = cashDesk->computeShiftStatistics(shift.id);

    const fs::path path = dir / "state.json";
    cashDesk->saveCheckpoint(path);
    auto restored = desk::CashDesk::fromCheckpoint(
        path, makeConfig(), desk::makeNullLogger("restored"));

    EXPECT_EQ(restored->balanceOf(kCourier), DEC(150.55));
    EXPECT_EQ(restored->getOpenShift(kCashier)->id, shift.id);
    const auto after = restored->computeShiftStatistics(shift.id);
    EXPECT_EQ(after.salesCash, before.salesCash);
    EXPECT_EQ(after.theoreticalCash, before.theoreticalCash);
    EXPECT_THAT(restored->outstandingOrders(kCourier), SizeIs(1));

    const std::vector<OrderId> ids{1};
    EXPECT_EQ(restored->processHandover(shift.id, kCourier, ids), DEC(150.55));
    expectLedgerError(
        [&] { restored->openShift(kCashier, 0_dec); }, ledger::ErrorCode::ALREADY_OPEN);
}

//-------------------------------------------------------------------------

TEST_F(CashDeskOutputsTest, CheckpointPrecisionMustMatchConfig)
{
    const fs::path path = dir / "state.json";
    cashDesk->saveCheckpoint(path);

    auto config = makeConfig();
    config.amountDecimals = 3;
    EXPECT_THROW(
        (void)desk::CashDesk::fromCheckpoint(path, config, desk::makeNullLogger("restored")),
        std::invalid_argument);
}

//-------------------------------------------------------------------------
