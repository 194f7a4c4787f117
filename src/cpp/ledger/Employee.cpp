/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/Employee.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

void Employee::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::DOUBLE);
}

//-------------------------------------------------------------------------

void Employee::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::PACKED);
}

//-------------------------------------------------------------------------

Employee Employee::fromJson(const rapidjson::Value& json)
{
    return Employee{
        .id = json["id"].GetUint(),
        .fullName = json["fullName"].GetString(),
        .role = enumFromString<EmployeeRole>(json["role"].GetString()),
        .cashBalance = json::getDecimal(json["cashBalance"])
    };
}

//-------------------------------------------------------------------------

void Employee::serialize(
    rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("fullName", rapidjson::Value{fullName.c_str(), allocator}, allocator);
        json.AddMember(
            "role", rapidjson::Value{magic_enum::enum_name(role).data(), allocator}, allocator);
        json::setDecimalMember(json, "cashBalance", cashBalance, encoding);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
