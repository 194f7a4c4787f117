/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"
#include "cashdesk/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace cashdesk::literals;

//-------------------------------------------------------------------------

// Shift and transaction ids are assigned by the ledger; employee and order
// ids come from the subsystems owning those rows.
using ShiftId = uint32_t;
using TransactionId = uint32_t;
using EmployeeId = uint32_t;
using OrderId = uint32_t;

// Closed interval of epoch milliseconds.
struct Timespan
{
    Timestamp begin, end;

    [[nodiscard]] bool contains(Timestamp timestamp) const noexcept
    {
        return begin <= timestamp && timestamp <= end;
    }
};

// Emitted from whichever thread committed, so slots are mutex guarded.
template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using Signal = bs2::signal<SlotType>;

//-------------------------------------------------------------------------
