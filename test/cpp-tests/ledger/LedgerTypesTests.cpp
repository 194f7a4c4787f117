/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/Employee.hpp"
#include "cashdesk/ledger/LedgerError.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::ledger;
using namespace cashdesk::literals;

using namespace testing;

//-------------------------------------------------------------------------

TEST(EnumFromStringTest, AcceptsAnyCaseAndDashes)
{
    EXPECT_EQ(enumFromString<PaymentMethod>("cash"), PaymentMethod::CASH);
    EXPECT_EQ(enumFromString<PaymentMethod>("CARD"), PaymentMethod::CARD);
    EXPECT_EQ(enumFromString<TransactionKind>("handover-in"), TransactionKind::HANDOVER_IN);
    EXPECT_EQ(enumFromString<EmployeeRole>("Waiter"), EmployeeRole::WAITER);
}

TEST(EnumFromStringTest, UnknownNameThrows)
{
    EXPECT_THROW((void)enumFromString<PaymentMethod>("crypto"), std::invalid_argument);
    EXPECT_THROW((void)enumFromString<EmployeeRole>(""), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ValidateDecimalPlacesTest, Bounds)
{
    EXPECT_EQ(validateDecimalPlaces(0), 0u);
    EXPECT_EQ(validateDecimalPlaces(json::kMaxDecimalPlaces), json::kMaxDecimalPlaces);
    EXPECT_THROW(
        (void)validateDecimalPlaces(json::kMaxDecimalPlaces + 1), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(AmountValidationTest, RoundsToLedgerPrecision)
{
    EXPECT_EQ(validatePositiveAmount(DEC(10.004), 2, "Amount"), DEC(10.00));
    EXPECT_EQ(validateNonNegativeAmount(0_dec, 2, "Start cash"), 0_dec);
}

TEST(AmountValidationTest, RejectsAmountsThatRoundToZero)
{
    try {
        (void)validatePositiveAmount(DEC(0.004), 2, "Amount");
        FAIL() << "Expected LedgerError";
    }
    catch (const LedgerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_AMOUNT);
        EXPECT_THAT(e.what(), HasSubstr("Amount must be positive"));
    }
    EXPECT_THROW((void)validateNonNegativeAmount(DEC(-0.01), 2, "Start cash"), LedgerError);
}

TEST(LedgerErrorTest, NotFoundHelpersCarryCode)
{
    try {
        throwOrderNotFound(42);
    }
    catch (const LedgerError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ORDER_NOT_FOUND);
        EXPECT_STREQ(e.what(), "Order #42 not found");
    }
}

//-------------------------------------------------------------------------

TEST(EmployeeTest, CheckpointKeepsExactBalance)
{
    const Employee employee{
        .id = 7,
        .fullName = "Olena",
        .role = EmployeeRole::COURIER,
        .cashBalance = DEC(1234567.89)
    };

    rapidjson::Document json;
    employee.checkpointSerialize(json);
    const auto restored = Employee::fromJson(json);

    EXPECT_EQ(restored.id, employee.id);
    EXPECT_EQ(restored.fullName, employee.fullName);
    EXPECT_EQ(restored.role, EmployeeRole::COURIER);
    EXPECT_EQ(restored.cashBalance, employee.cashBalance);
}

TEST(EmployeeTest, Formatting)
{
    const Employee employee{.id = 3, .fullName = "Mykola", .role = EmployeeRole::COURIER};
    EXPECT_EQ(fmt::format("{}", employee), "Mykola (#3, COURIER)");
}

//-------------------------------------------------------------------------
