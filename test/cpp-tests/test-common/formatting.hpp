/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "cashdesk/decimal/decimal.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace BloombergLP::bdldfp
{

inline void PrintTo(const Decimal64& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace BloombergLP::bdldfp

//-------------------------------------------------------------------------
