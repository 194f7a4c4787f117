/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

enum class PaymentMethod : uint8_t
{
    CASH,
    CARD
};

enum class TransactionKind : uint8_t
{
    MANUAL_IN,
    MANUAL_OUT,
    HANDOVER_IN
};

enum class EmployeeRole : uint8_t
{
    CASHIER,
    OPERATOR,
    COURIER,
    WAITER
};

//-------------------------------------------------------------------------

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces, std::source_location sl = std::source_location::current());

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E enumFromString(
    std::string_view name, std::source_location sl = std::source_location::current())
{
    if (auto value = magic_enum::enum_cast<E>(name, magic_enum::case_insensitive)) {
        return *value;
    }
    std::string normalized{name};
    ranges::replace(normalized, '-', '_');
    if (auto value = magic_enum::enum_cast<E>(normalized, magic_enum::case_insensitive)) {
        return *value;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Unknown {} '{}'", sl.function_name(), magic_enum::enum_type_name<E>(), name)};
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
