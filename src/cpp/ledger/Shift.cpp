/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/ledger/Shift.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::ledger
{

//-------------------------------------------------------------------------

void Shift::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::DOUBLE);
}

//-------------------------------------------------------------------------

void Shift::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    serialize(json, key, json::DecimalEncoding::PACKED);
}

//-------------------------------------------------------------------------

Shift Shift::fromJson(const rapidjson::Value& json)
{
    return Shift{
        .id = json["id"].GetUint(),
        .employeeId = json["employeeId"].GetUint(),
        .startTime = json["startTime"].GetUint64(),
        .endTime = !json["endTime"].IsNull()
            ? std::make_optional<Timestamp>(json["endTime"].GetUint64())
            : std::nullopt,
        .startCash = json::getDecimal(json["startCash"]),
        .endCashActual = json::getOptionalDecimal(json["endCashActual"]),
        .closed = json["closed"].GetBool(),
        .totals = [&] -> std::optional<ShiftTotals> {
            const rapidjson::Value& totalsJson = json["totals"];
            if (totalsJson.IsNull()) return std::nullopt;
            return ShiftTotals{
                .salesCash = json::getDecimal(totalsJson["salesCash"]),
                .salesCard = json::getDecimal(totalsJson["salesCard"]),
                .serviceIn = json::getDecimal(totalsJson["serviceIn"]),
                .serviceOut = json::getDecimal(totalsJson["serviceOut"])
            };
        }()
    };
}

//-------------------------------------------------------------------------

void Shift::serialize(
    rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const
{
    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("employeeId", rapidjson::Value{employeeId}, allocator);
        json.AddMember("startTime", rapidjson::Value{startTime}, allocator);
        json::setOptionalMember(json, "endTime", endTime);
        json::setDecimalMember(json, "startCash", startCash, encoding);
        json::setDecimalMember(json, "endCashActual", endCashActual, encoding);
        json.AddMember("closed", rapidjson::Value{closed}, allocator);
        if (!totals.has_value()) {
            json.AddMember("totals", rapidjson::Value{}.SetNull(), allocator);
            return;
        }
        json::serializeHelper(
            json,
            "totals",
            [&](rapidjson::Document& json) {
                json.SetObject();
                json::setDecimalMember(json, "salesCash", totals->salesCash, encoding);
                json::setDecimalMember(json, "salesCard", totals->salesCard, encoding);
                json::setDecimalMember(json, "serviceIn", totals->serviceIn, encoding);
                json::setDecimalMember(json, "serviceOut", totals->serviceOut, encoding);
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
