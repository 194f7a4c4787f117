/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/OrderRecord.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

namespace
{

template<typename T>
[[nodiscard]] std::optional<T> optionalMember(const rapidjson::Value& json, const char* name)
{
    if (!json.HasMember(name) || json[name].IsNull()) return std::nullopt;
    return json[name].Get<T>();
}

}  // namespace

//-------------------------------------------------------------------------

void OrderRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::DOUBLE);
}

//-------------------------------------------------------------------------

void OrderRecord::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::PACKED);
}

//-------------------------------------------------------------------------

OrderRecord OrderRecord::fromJson(const rapidjson::Value& json)
{
    return OrderRecord{
        .id = json["id"].GetUint(),
        .paymentMethod = enumFromString<PaymentMethod>(json["paymentMethod"].GetString()),
        .total = json::getDecimal(json["total"]),
        .turnedIn = json["turnedIn"].GetBool(),
        .linkedShiftId = optionalMember<uint32_t>(json, "linkedShiftId"),
        .courierId = optionalMember<uint32_t>(json, "courierId"),
        .waiterId = optionalMember<uint32_t>(json, "waiterId"),
        .completedAt = optionalMember<uint64_t>(json, "completedAt"),
        .debtHolderId = optionalMember<uint32_t>(json, "debtHolderId")
    };
}

//-------------------------------------------------------------------------

void OrderRecord::serialize(
    rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember(
            "paymentMethod",
            rapidjson::Value{magic_enum::enum_name(paymentMethod).data(), allocator},
            allocator);
        json::setDecimalMember(json, "total", total, encoding);
        json.AddMember("turnedIn", rapidjson::Value{turnedIn}, allocator);
        json::setOptionalMember(json, "linkedShiftId", linkedShiftId);
        json::setOptionalMember(json, "courierId", courierId);
        json::setOptionalMember(json, "waiterId", waiterId);
        json::setOptionalMember(json, "completedAt", completedAt);
        json::setOptionalMember(json, "debtHolderId", debtHolderId);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
