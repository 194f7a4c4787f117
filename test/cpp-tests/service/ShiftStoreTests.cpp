/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "test-common/LedgerFixture.hpp"

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::test;
using namespace cashdesk::literals;

using namespace testing;

using ledger::ErrorCode;

//-------------------------------------------------------------------------

struct ShiftStoreTest : LedgerFixture {};

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, OpenCreatesOpenShift)
{
    const auto shift = cashDesk->openShift(kCashier, DEC(500.00));

    EXPECT_EQ(shift.employeeId, kCashier);
    EXPECT_EQ(shift.startCash, DEC(500.00));
    EXPECT_FALSE(shift.closed);
    EXPECT_FALSE(shift.endTime.has_value());
    EXPECT_FALSE(shift.totals.has_value());

    const auto open = cashDesk->getOpenShift(kCashier);
    ASSERT_TRUE(open.has_value());
    EXPECT_EQ(open->id, shift.id);
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, SecondOpenForSameEmployeeFails)
{
    const auto first = cashDesk->openShift(kCashier, 100_dec);

    expectLedgerError([&] { cashDesk->openShift(kCashier, 200_dec); }, ErrorCode::ALREADY_OPEN);

    EXPECT_EQ(cashDesk->getOpenShift(kCashier)->id, first.id);
    EXPECT_THAT(cashDesk->listShifts(kCashier), SizeIs(1));
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, ReopenAfterCloseGetsNewShift)
{
    const auto first = cashDesk->openShift(kCashier, 100_dec);
    cashDesk->closeShift(first.id, 100_dec);
    const auto second = cashDesk->openShift(kCashier, 50_dec);

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(cashDesk->getOpenShift(kCashier)->id, second.id);
    EXPECT_THAT(cashDesk->listShifts(kCashier), SizeIs(2));
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, OpenRejectsUnknownEmployeeAndNegativeCash)
{
    expectLedgerError([&] { cashDesk->openShift(99, 0_dec); }, ErrorCode::EMPLOYEE_NOT_FOUND);
    expectLedgerError(
        [&] { cashDesk->openShift(kCashier, DEC(-1.00)); }, ErrorCode::INVALID_AMOUNT);
    EXPECT_FALSE(cashDesk->getOpenShift(kCashier).has_value());
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, GetOpenShiftIsNoneWithoutOpenShift)
{
    EXPECT_FALSE(cashDesk->getOpenShift(kCashier).has_value());
    EXPECT_FALSE(cashDesk->getAnyOpenShift().has_value());
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, AnyOpenShiftPrefersLowestIdByDefault)
{
    const auto first = cashDesk->openShift(kOperator, 0_dec);
    cashDesk->openShift(kCashier, 0_dec);

    EXPECT_EQ(cashDesk->getAnyOpenShift()->id, first.id);
}

//-------------------------------------------------------------------------

struct MostRecentFallbackTest : LedgerFixture
{
    virtual desk::CashDeskConfig makeConfig() const override
    {
        return {.fallbackShift = store::FallbackPolicy::MOST_RECENT};
    }
};

TEST_F(MostRecentFallbackTest, AnyOpenShiftPrefersMostRecent)
{
    cashDesk->openShift(kOperator, 0_dec);
    const auto second = cashDesk->openShift(kCashier, 0_dec);

    EXPECT_EQ(cashDesk->getAnyOpenShift()->id, second.id);
}

TEST_F(MostRecentFallbackTest, AnyOpenShiftComparesStartTimeBeforeId)
{
    const auto first = cashDesk->openShift(kOperator, 0_dec);
    now = 500;
    cashDesk->openShift(kCashier, 0_dec);

    EXPECT_EQ(cashDesk->getAnyOpenShift()->id, first.id);
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, CloseFreezesTotalsAndReportsDiscrepancy)
{
    const auto shift = cashDesk->openShift(kCashier, 500_dec);
    addOrder(1, 200_dec);
    addOrder(2, 80_dec, ledger::PaymentMethod::CARD);
    cashDesk->onOrderCompleted(1, kCashier);
    cashDesk->onOrderCompleted(2, kCashier);
    cashDesk->deposit(shift.id, 30_dec, "change");
    cashDesk->withdraw(shift.id, 50_dec, "groceries");

    const auto report = cashDesk->closeShift(shift.id, DEC(675.50));

    EXPECT_TRUE(report.final);
    EXPECT_EQ(report.theoreticalCash, 680_dec);
    EXPECT_EQ(report.endCashActual, DEC(675.50));
    EXPECT_EQ(report.discrepancy, DEC(-4.50));

    const auto closed = cashDesk->getShift(shift.id).value();
    EXPECT_TRUE(closed.closed);
    EXPECT_TRUE(closed.endTime.has_value());
    EXPECT_EQ(closed.endCashActual, DEC(675.50));
    ASSERT_TRUE(closed.totals.has_value());
    EXPECT_EQ(closed.totals->salesCash, 200_dec);
    EXPECT_EQ(closed.totals->salesCard, 80_dec);
    EXPECT_EQ(closed.totals->serviceIn, 30_dec);
    EXPECT_EQ(closed.totals->serviceOut, 50_dec);
    EXPECT_FALSE(cashDesk->getOpenShift(kCashier).has_value());
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, SecondCloseFailsAndKeepsFrozenTotals)
{
    const auto shift = cashDesk->openShift(kCashier, 100_dec);
    addOrder(1, 40_dec);
    cashDesk->onOrderCompleted(1, kCashier);
    cashDesk->closeShift(shift.id, 140_dec);
    const auto frozen = cashDesk->getShift(shift.id).value();

    expectLedgerError(
        [&] { cashDesk->closeShift(shift.id, 999_dec); }, ErrorCode::ALREADY_CLOSED);

    const auto after = cashDesk->getShift(shift.id).value();
    EXPECT_EQ(after.endCashActual, frozen.endCashActual);
    EXPECT_EQ(after.endTime, frozen.endTime);
    EXPECT_EQ(after.totals->salesCash, frozen.totals->salesCash);
    EXPECT_EQ(after.totals->serviceIn, frozen.totals->serviceIn);
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, CloseUnknownShiftFails)
{
    expectLedgerError([&] { cashDesk->closeShift(42, 0_dec); }, ErrorCode::SHIFT_NOT_FOUND);
}

//-------------------------------------------------------------------------

TEST_F(ShiftStoreTest, ClosedShiftRejectsMovements)
{
    const auto shift = cashDesk->openShift(kCashier, 0_dec);
    cashDesk->closeShift(shift.id, 0_dec);

    expectLedgerError([&] { cashDesk->deposit(shift.id, 10_dec, ""); }, ErrorCode::SHIFT_CLOSED);
    EXPECT_THAT(cashDesk->transactionsForShift(shift.id), IsEmpty());
}

//-------------------------------------------------------------------------
