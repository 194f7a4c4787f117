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

struct Employee
{
    EmployeeId id{};
    std::string fullName;
    EmployeeRole role{EmployeeRole::CASHIER};
    // Cash held on the business's behalf, never negative.
    decimal_t cashBalance{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Employee fromJson(const rapidjson::Value& json);

private:
    void serialize(
        rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<cashdesk::ledger::Employee>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cashdesk::ledger::Employee& employee, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{} (#{}, {})",
            employee.fullName,
            employee.id,
            magic_enum::enum_name(employee.role));
    }
};

//-------------------------------------------------------------------------
