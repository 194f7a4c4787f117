/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/Transaction.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

void Transaction::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::DOUBLE);
}

//-------------------------------------------------------------------------

void Transaction::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::PACKED);
}

//-------------------------------------------------------------------------

Transaction Transaction::fromJson(const rapidjson::Value& json)
{
    return Transaction{
        .id = json["id"].GetUint(),
        .shiftId = json["shiftId"].GetUint(),
        .amount = json::getDecimal(json["amount"]),
        .kind = enumFromString<TransactionKind>(json["kind"].GetString()),
        .comment = json["comment"].GetString(),
        .timestamp = json["timestamp"].GetUint64()
    };
}

//-------------------------------------------------------------------------

void Transaction::serialize(
    rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("shiftId", rapidjson::Value{shiftId}, allocator);
        json::setDecimalMember(json, "amount", amount, encoding);
        json.AddMember(
            "kind", rapidjson::Value{magic_enum::enum_name(kind).data(), allocator}, allocator);
        json.AddMember("comment", rapidjson::Value{comment.c_str(), allocator}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
