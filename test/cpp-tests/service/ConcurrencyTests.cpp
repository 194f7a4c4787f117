/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "test-common/LedgerFixture.hpp"

#include <barrier>
#include <thread>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::test;
using namespace cashdesk::literals;

using namespace testing;

using ledger::ErrorCode;
using ledger::PaymentMethod;

//-------------------------------------------------------------------------

namespace
{

inline constexpr size_t kThreads = 8;

template<typename Fn>
void runConcurrently(Fn fn)
{
    std::barrier start{static_cast<std::ptrdiff_t>(kThreads)};
    std::vector<std::jthread> threads;
    for (size_t i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            start.arrive_and_wait();
            fn(i);
        });
    }
}

}  // namespace

//-------------------------------------------------------------------------

struct ConcurrencyTest : LedgerFixture {};

//-------------------------------------------------------------------------

TEST_F(ConcurrencyTest, OnlyOneOpenShiftPerEmployee)
{
    std::atomic<uint32_t> opened{}, rejected{};

    runConcurrently([&](size_t) {
        try {
            cashDesk->openShift(kCashier, 0_dec);
            ++opened;
        }
        catch (const ledger::LedgerError& e) {
            EXPECT_EQ(e.code(), ErrorCode::ALREADY_OPEN);
            ++rejected;
        }
    });

    EXPECT_EQ(opened.load(), 1u);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_THAT(cashDesk->listShifts(kCashier), SizeIs(1));
}

//-------------------------------------------------------------------------

TEST_F(ConcurrencyTest, SameOrdersAreHandedOverOnce)
{
    const auto shift = cashDesk->openShift(kCashier, 0_dec);
    addOrder(1, 100_dec, PaymentMethod::CASH, kCourier);
    addOrder(2, 50_dec, PaymentMethod::CASH, kCourier);
    cashDesk->onOrderCompleted(1, kOperator);
    cashDesk->onOrderCompleted(2, kOperator);

    std::atomic<uint32_t> succeeded{}, empty{};
    runConcurrently([&](size_t i) {
        const std::vector<OrderId> ids = i % 2 == 0
            ? std::vector<OrderId>{1, 2}
            : std::vector<OrderId>{2, 1};
        try {
            EXPECT_EQ(cashDesk->processHandover(shift.id, kCourier, ids), 150_dec);
            ++succeeded;
        }
        catch (const ledger::LedgerError& e) {
            EXPECT_EQ(e.code(), ErrorCode::NO_ELIGIBLE_ORDERS);
            ++empty;
        }
    });

    EXPECT_EQ(succeeded.load(), 1u);
    EXPECT_EQ(empty.load(), kThreads - 1);
    EXPECT_EQ(cashDesk->balanceOf(kCourier), 0_dec);
    EXPECT_THAT(cashDesk->transactionsForShift(shift.id), SizeIs(1));
    EXPECT_EQ(cashDesk->computeShiftStatistics(shift.id).theoreticalCash, 150_dec);
}

//-------------------------------------------------------------------------

TEST_F(ConcurrencyTest, CompletionsRacingACloseNeverLinkToClosedShift)
{
    const auto shift = cashDesk->openShift(kCashier, 0_dec);
    for (OrderId id = 1; id <= kThreads; ++id) {
        addOrder(id, 10_dec);
    }

    runConcurrently([&](size_t i) {
        if (i == 0) {
            cashDesk->closeShift(shift.id, 0_dec);
        } else {
            cashDesk->onOrderCompleted(static_cast<OrderId>(i), kCashier);
        }
    });

    const auto closed = cashDesk->getShift(shift.id).value();
    const auto orders = cashDesk->store().orders();
    const auto linked = ranges::count_if(orders, [&](const auto& order) {
        return order.linkedShiftId == shift.id;
    });
    EXPECT_EQ(closed.totals->salesCash, decimal_t{linked} * 10_dec);
}

//-------------------------------------------------------------------------

TEST_F(ConcurrencyTest, ParallelDepositsAllLand)
{
    const auto shift = cashDesk->openShift(kCashier, 0_dec);

    runConcurrently([&](size_t) {
        for (int i = 0; i < 25; ++i) {
            cashDesk->deposit(shift.id, 1_dec, "");
        }
    });

    const auto log = cashDesk->transactionsForShift(shift.id);
    EXPECT_THAT(log, SizeIs(kThreads * 25));
    EXPECT_EQ(cashDesk->computeShiftStatistics(shift.id).serviceIn, decimal_t{kThreads * 25});
}

//-------------------------------------------------------------------------
