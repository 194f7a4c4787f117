/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/ledger/types.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

enum class ErrorCode
{
    INVALID_AMOUNT,
    ALREADY_OPEN,
    ALREADY_CLOSED,
    SHIFT_NOT_FOUND,
    SHIFT_CLOSED,
    EMPLOYEE_NOT_FOUND,
    ORDER_NOT_FOUND,
    NO_ELIGIBLE_ORDERS,
    CONSTRAINT_VIOLATION
};

//-------------------------------------------------------------------------

class LedgerError : public std::runtime_error
{
public:
    LedgerError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

//-------------------------------------------------------------------------

[[noreturn]] void throwShiftNotFound(ShiftId shiftId);
[[noreturn]] void throwEmployeeNotFound(EmployeeId employeeId);
[[noreturn]] void throwOrderNotFound(OrderId orderId);

// Rounds to the ledger precision and rejects anything not strictly positive.
[[nodiscard]] decimal_t validatePositiveAmount(
    decimal_t amount, uint32_t decimalPlaces, std::string_view what);

[[nodiscard]] decimal_t validateNonNegativeAmount(
    decimal_t amount, uint32_t decimalPlaces, std::string_view what);

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
