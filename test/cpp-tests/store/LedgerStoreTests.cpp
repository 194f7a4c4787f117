/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/LedgerError.hpp"
#include "cashdesk/store/UnitOfWork.hpp"
#include "json_util.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::literals;

using namespace testing;

using ledger::ErrorCode;
using store::LockKey;
using store::UnitOfWork;

//-------------------------------------------------------------------------

struct LedgerStoreTest : Test
{
    virtual void SetUp() override
    {
        store.putEmployee({.id = 1, .fullName = "Olena", .role = ledger::EmployeeRole::CASHIER});
        store.putEmployee({.id = 2, .fullName = "Mykola", .role = ledger::EmployeeRole::COURIER});
        store.putOrder({.id = 10, .total = 25_dec});
    }

    ShiftId openShift(EmployeeId employeeId, decimal_t startCash = 0_dec)
    {
        UnitOfWork uow{store};
        uow.acquire(LockKey::employee(employeeId));
        const auto shiftId = uow.insertShift({.employeeId = employeeId, .startCash = startCash});
        uow.commit();
        return shiftId;
    }

    static void expectViolation(UnitOfWork& uow)
    {
        try {
            uow.commit();
            ADD_FAILURE() << "Expected a constraint violation";
        }
        catch (const ledger::LedgerError& e) {
            EXPECT_EQ(e.code(), ErrorCode::CONSTRAINT_VIOLATION) << e.what();
        }
    }

    store::LedgerStore store;
};

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, CommitAppliesStagedWrites)
{
    const auto shiftId = openShift(1, 100_dec);

    UnitOfWork uow{store};
    uow.acquire({LockKey::order(10), LockKey::shift(shiftId)});
    auto order = uow.order(10).value();
    order.linkedShiftId = shiftId;
    uow.updateOrder(order);
    uow.appendTransaction({.shiftId = shiftId, .amount = 5_dec, .comment = "float"});

    EXPECT_EQ(uow.order(10)->linkedShiftId, shiftId);
    EXPECT_FALSE(store.order(10)->linkedShiftId.has_value());

    const auto stored = uow.commit();

    ASSERT_THAT(stored, SizeIs(1));
    EXPECT_EQ(stored[0].id, 1u);
    EXPECT_EQ(store.order(10)->linkedShiftId, shiftId);
    EXPECT_THAT(store.transactionsForShift(shiftId), SizeIs(1));
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, DestroyedUnitLeavesStoreUntouched)
{
    const auto shiftId = openShift(1);
    {
        UnitOfWork uow{store};
        uow.acquire({LockKey::employee(2), LockKey::shift(shiftId)});
        auto employee = uow.employee(2).value();
        employee.cashBalance = 40_dec;
        uow.updateEmployee(employee);
        uow.appendTransaction({.shiftId = shiftId, .amount = 5_dec});
    }

    EXPECT_EQ(store.employee(2)->cashBalance, 0_dec);
    EXPECT_THAT(store.transactions(), IsEmpty());
    EXPECT_EQ(store.locks().size(), 0u);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, SecondOpenShiftIsViolation)
{
    openShift(1);

    UnitOfWork uow{store};
    uow.acquire(LockKey::employee(1));
    uow.insertShift({.employeeId = 1});
    expectViolation(uow);

    EXPECT_THAT(store.shifts(), SizeIs(1));
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, NegativeBalanceIsViolation)
{
    UnitOfWork uow{store};
    uow.acquire(LockKey::employee(2));
    auto employee = uow.employee(2).value();
    employee.cashBalance = DEC(-0.01);
    uow.updateEmployee(employee);
    expectViolation(uow);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, RelinkIsViolation)
{
    const auto first = openShift(1);
    const auto second = openShift(2);
    {
        UnitOfWork uow{store};
        uow.acquire({LockKey::order(10), LockKey::shift(first)});
        auto order = uow.order(10).value();
        order.linkedShiftId = first;
        uow.updateOrder(order);
        uow.commit();
    }

    UnitOfWork uow{store};
    uow.acquire(LockKey::order(10));
    auto order = uow.order(10).value();
    order.linkedShiftId = second;
    uow.updateOrder(order);
    expectViolation(uow);

    EXPECT_EQ(store.order(10)->linkedShiftId, first);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, ClosedShiftIsImmutable)
{
    const auto shiftId = openShift(1);
    {
        UnitOfWork uow{store};
        uow.acquire(LockKey::shift(shiftId));
        auto shift = uow.shift(shiftId).value();
        shift.closed = true;
        uow.updateShift(shift);
        uow.commit();
    }

    UnitOfWork uow{store};
    uow.acquire(LockKey::shift(shiftId));
    auto shift = uow.shift(shiftId).value();
    shift.startCash = 1_dec;
    uow.updateShift(shift);
    expectViolation(uow);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, FailedCommitAppliesNothing)
{
    const auto shiftId = openShift(1);

    UnitOfWork uow{store};
    uow.acquire({LockKey::order(10), LockKey::employee(2), LockKey::shift(shiftId)});
    auto order = uow.order(10).value();
    order.turnedIn = true;
    uow.updateOrder(order);
    uow.appendTransaction({.shiftId = shiftId, .amount = 25_dec});
    auto employee = uow.employee(2).value();
    employee.cashBalance = -25_dec;
    uow.updateEmployee(employee);
    expectViolation(uow);

    EXPECT_FALSE(store.order(10)->turnedIn);
    EXPECT_THAT(store.transactions(), IsEmpty());
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, WritesRequireTheRowLock)
{
    UnitOfWork uow{store};
    auto order = uow.order(10).value();
    EXPECT_THROW(uow.updateOrder(order), std::logic_error);

    uow.acquire(LockKey::shift(1));
    EXPECT_THROW(uow.acquire(LockKey::order(10)), std::logic_error);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, PutOrderKeepsLedgerFields)
{
    const auto shiftId = openShift(1);
    {
        UnitOfWork uow{store};
        uow.acquire({LockKey::order(10), LockKey::shift(shiftId)});
        auto order = uow.order(10).value();
        order.linkedShiftId = shiftId;
        order.turnedIn = true;
        uow.updateOrder(order);
        uow.commit();
    }

    store.putOrder({.id = 10, .total = 30_dec, .courierId = 2});

    const auto order = store.order(10).value();
    EXPECT_EQ(order.total, 30_dec);
    EXPECT_EQ(order.courierId, 2u);
    EXPECT_TRUE(order.turnedIn);
    EXPECT_EQ(order.linkedShiftId, shiftId);
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, TransactionsInRangeAreInclusive)
{
    const auto shiftId = openShift(1);
    UnitOfWork uow{store};
    uow.acquire(LockKey::shift(shiftId));
    for (Timestamp timestamp : {100u, 200u, 300u}) {
        uow.appendTransaction({.shiftId = shiftId, .amount = 1_dec, .timestamp = timestamp});
    }
    uow.commit();

    EXPECT_THAT(store.transactionsInRange({.begin = 100, .end = 200}), SizeIs(2));
    EXPECT_THAT(store.transactionsInRange({.begin = 201, .end = 299}), IsEmpty());
}

//-------------------------------------------------------------------------

TEST_F(LedgerStoreTest, CheckpointRestoresEveryTable)
{
    const auto shiftId = openShift(1, DEC(12.34));
    {
        UnitOfWork uow{store};
        uow.acquire({LockKey::order(10), LockKey::employee(2), LockKey::shift(shiftId)});
        auto order = uow.order(10).value();
        order.linkedShiftId = shiftId;
        uow.updateOrder(order);
        auto employee = uow.employee(2).value();
        employee.cashBalance = DEC(25.00);
        uow.updateEmployee(employee);
        uow.appendTransaction({.shiftId = shiftId, .amount = DEC(0.10), .comment = "coin"});
        uow.commit();
    }

    rapidjson::Document json;
    store.checkpointSerialize(json);
    const auto restored = store::LedgerStore::fromJson(json);

    EXPECT_EQ(restored->decimalPlaces(), store.decimalPlaces());
    EXPECT_EQ(restored->shift(shiftId)->startCash, DEC(12.34));
    EXPECT_EQ(restored->employee(2)->cashBalance, DEC(25.00));
    EXPECT_EQ(restored->order(10)->linkedShiftId, shiftId);
    ASSERT_THAT(restored->transactions(), SizeIs(1));
    EXPECT_EQ(restored->transactions()[0].amount, DEC(0.10));
    EXPECT_EQ(restored->openShiftOf(1)->id, shiftId);
    EXPECT_NE(restored->allocateShiftId(), shiftId);
}

//-------------------------------------------------------------------------

TEST(LedgerStore, RejectsMalformedCheckpoint)
{
    EXPECT_THROW(store::LedgerStore::fromJson(json::str2json("[]")), std::invalid_argument);
    EXPECT_THROW(
        store::LedgerStore::fromJson(json::str2json(R"({"decimalPlaces": 2})")),
        std::invalid_argument);
}

//-------------------------------------------------------------------------

namespace
{

constexpr std::string_view kEmployeeRow =
    R"({{"id": {}, "fullName": "Olena", "role": "COURIER", "cashBalance": {}}})";

constexpr std::string_view kShiftRow =
    R"({{"id": 1, "employeeId": 1, "startTime": 100, "endTime": null, "startCash": {},)"
    R"( "endCashActual": null, "closed": false, "totals": null}})";

constexpr std::string_view kTransactionRow =
    R"({{"id": {}, "shiftId": 1, "amount": {}, "kind": "MANUAL_IN", "comment": "", "timestamp": 100}})";

std::string checkpoint(
    std::vector<std::string> employees,
    std::vector<std::string> shifts = {},
    std::vector<std::string> transactions = {})
{
    return fmt::format(
        R"({{"decimalPlaces": 2, "employees": [{}], "shifts": [{}], "orders": [], "transactions": [{}]}})",
        fmt::join(employees, ", "),
        fmt::join(shifts, ", "),
        fmt::join(transactions, ", "));
}

std::string employeeRow(EmployeeId id, std::string_view balance)
{
    return fmt::format(fmt::runtime(kEmployeeRow), id, balance);
}

}  // namespace

struct LedgerStoreRestoreTest : TestWithParam<std::string>
{};

TEST_P(LedgerStoreRestoreTest, RejectsCheckpointBreakingLedgerRules)
{
    EXPECT_THROW(store::LedgerStore::fromJson(json::str2json(GetParam())), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    LedgerStore,
    LedgerStoreRestoreTest,
    Values(
        checkpoint({employeeRow(1, "-5.0")}),
        checkpoint({employeeRow(1, "0.0"), employeeRow(1, "3.5")}),
        checkpoint(
            {employeeRow(1, "0.0")},
            {fmt::format(fmt::runtime(kShiftRow), "-0.5")}),
        checkpoint(
            {employeeRow(1, "0.0")},
            {fmt::format(fmt::runtime(kShiftRow), "10.0")},
            {fmt::format(fmt::runtime(kTransactionRow), 1, "0.0")}),
        checkpoint(
            {employeeRow(1, "0.0")},
            {fmt::format(fmt::runtime(kShiftRow), "10.0")},
            {fmt::format(fmt::runtime(kTransactionRow), 1, "0.001")}),
        checkpoint(
            {employeeRow(1, "0.0")},
            {fmt::format(fmt::runtime(kShiftRow), "10.0")},
            {fmt::format(fmt::runtime(kTransactionRow), 1, "2.5"),
             fmt::format(fmt::runtime(kTransactionRow), 1, "4.5")})));

TEST(LedgerStore, RestoredAmountsUseCheckpointPrecision)
{
    const auto restored = store::LedgerStore::fromJson(json::str2json(checkpoint(
        {employeeRow(1, "10.004")},
        {fmt::format(fmt::runtime(kShiftRow), "99.996")},
        {fmt::format(fmt::runtime(kTransactionRow), 1, "0.005")})));

    EXPECT_EQ(restored->employee(1)->cashBalance, DEC(10.00));
    EXPECT_EQ(restored->shift(1)->startCash, DEC(100.00));
    ASSERT_THAT(restored->transactions(), SizeIs(1));
    EXPECT_EQ(restored->transactions()[0].amount, DEC(0.01));
}

//-------------------------------------------------------------------------
