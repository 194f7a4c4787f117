/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/report/ShiftReport.hpp"

//-------------------------------------------------------------------------

namespace cashdesk::report
{

//-------------------------------------------------------------------------

void ShiftReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    static constexpr auto encoding = json::DecimalEncoding::DOUBLE;

    auto serialize = [&](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("type", rapidjson::StringRef(final ? "Z" : "X"), allocator);
        json.AddMember("shiftId", rapidjson::Value{shiftId}, allocator);
        json.AddMember("employeeId", rapidjson::Value{employeeId}, allocator);
        json.AddMember("startTime", rapidjson::Value{startTime}, allocator);
        json::setOptionalMember(json, "endTime", endTime);
        json::setDecimalMember(json, "startCash", startCash, encoding);
        json::setDecimalMember(json, "salesCash", salesCash, encoding);
        json::setDecimalMember(json, "salesCard", salesCard, encoding);
        json::setDecimalMember(json, "totalSales", totalSales, encoding);
        json::setDecimalMember(json, "serviceIn", serviceIn, encoding);
        json::setDecimalMember(json, "serviceOut", serviceOut, encoding);
        json::setDecimalMember(json, "handoverIn", handoverIn, encoding);
        json::setDecimalMember(json, "collectedCashOrders", collectedCashOrders, encoding);
        json::setDecimalMember(json, "theoreticalCash", theoreticalCash, encoding);
        json::setDecimalMember(json, "endCashActual", endCashActual, encoding);
        json::setDecimalMember(json, "discrepancy", discrepancy, encoding);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::report

//-------------------------------------------------------------------------
