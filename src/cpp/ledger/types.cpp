/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/types.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

uint32_t validateDecimalPlaces(uint32_t decimalPlaces, std::source_location sl)
{
    if (decimalPlaces > json::kMaxDecimalPlaces) {
        throw std::invalid_argument{fmt::format(
            "{}: decimalPlaces should be <= {}, was {}",
            sl.function_name(), json::kMaxDecimalPlaces, decimalPlaces)};
    }
    return decimalPlaces;
}

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
