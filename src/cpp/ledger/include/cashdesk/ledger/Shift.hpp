/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Serializable.hpp"
#include "cashdesk/ledger/types.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

// Frozen at close from the statistics of that instant.
struct ShiftTotals
{
    decimal_t salesCash{};
    decimal_t salesCard{};
    decimal_t serviceIn{};
    decimal_t serviceOut{};
};

//-------------------------------------------------------------------------

struct Shift
{
    ShiftId id{};
    EmployeeId employeeId{};
    Timestamp startTime{};
    std::optional<Timestamp> endTime;
    decimal_t startCash{};
    std::optional<decimal_t> endCashActual;
    bool closed{};
    std::optional<ShiftTotals> totals;

    [[nodiscard]] bool isOpen() const noexcept { return !closed; }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Shift fromJson(const rapidjson::Value& json);

private:
    void serialize(
        rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
