/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/LedgerError.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

LedgerError::LedgerError(ErrorCode code, const std::string& message)
    : std::runtime_error{message}, m_code{code}
{}

//-------------------------------------------------------------------------

void throwShiftNotFound(ShiftId shiftId)
{
    throw LedgerError{ErrorCode::SHIFT_NOT_FOUND, fmt::format("Shift #{} not found", shiftId)};
}

//-------------------------------------------------------------------------

void throwEmployeeNotFound(EmployeeId employeeId)
{
    throw LedgerError{
        ErrorCode::EMPLOYEE_NOT_FOUND, fmt::format("Employee #{} not found", employeeId)};
}

//-------------------------------------------------------------------------

void throwOrderNotFound(OrderId orderId)
{
    throw LedgerError{ErrorCode::ORDER_NOT_FOUND, fmt::format("Order #{} not found", orderId)};
}

//-------------------------------------------------------------------------

decimal_t validatePositiveAmount(decimal_t amount, uint32_t decimalPlaces, std::string_view what)
{
    const decimal_t rounded = util::round(amount, decimalPlaces);
    if (!(rounded > 0_dec)) {
        throw LedgerError{
            ErrorCode::INVALID_AMOUNT,
            fmt::format("{} must be positive, was {}", what, amount)};
    }
    return rounded;
}

//-------------------------------------------------------------------------

decimal_t validateNonNegativeAmount(
    decimal_t amount, uint32_t decimalPlaces, std::string_view what)
{
    const decimal_t rounded = util::round(amount, decimalPlaces);
    if (rounded < 0_dec) {
        throw LedgerError{
            ErrorCode::INVALID_AMOUNT,
            fmt::format("{} cannot be negative, was {}", what, amount)};
    }
    return rounded;
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
