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

// Append-only drawer movement; never updated once stored.
struct Transaction
{
    TransactionId id{};
    ShiftId shiftId{};
    decimal_t amount{};
    TransactionKind kind{TransactionKind::MANUAL_IN};
    std::string comment;
    Timestamp timestamp{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Transaction fromJson(const rapidjson::Value& json);

private:
    void serialize(
        rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<cashdesk::ledger::Transaction>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const cashdesk::ledger::Transaction& tx, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} {} {} on shift #{}",
            tx.id,
            magic_enum::enum_name(tx.kind),
            tx.amount,
            tx.shiftId);
    }
};

//-------------------------------------------------------------------------
