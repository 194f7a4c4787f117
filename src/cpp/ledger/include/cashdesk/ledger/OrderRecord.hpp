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

/**
 * The ledger's view of an order owned by the order subsystem. Only
 * linkedShiftId, turnedIn, completedAt and debtHolderId are written by the
 * ledger; the
 * remaining fields are maintained externally.
 */
struct OrderRecord
{
    OrderId id{};
    PaymentMethod paymentMethod{PaymentMethod::CASH};
    decimal_t total{};
    // Whether the cash for this order has reached a drawer.
    bool turnedIn{};
    // Set at most once.
    std::optional<ShiftId> linkedShiftId;
    std::optional<EmployeeId> courierId;
    std::optional<EmployeeId> waiterId;
    std::optional<Timestamp> completedAt;
    // The employee whose balance carries this order's cash.
    std::optional<EmployeeId> debtHolderId;

    [[nodiscard]] bool isCash() const noexcept { return paymentMethod == PaymentMethod::CASH; }

    // The employee physically collecting the cash: the courier, else the waiter.
    [[nodiscard]] std::optional<EmployeeId> cashCollector() const noexcept
    {
        return courierId.has_value() ? courierId : waiterId;
    }

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static OrderRecord fromJson(const rapidjson::Value& json);

private:
    void serialize(
        rapidjson::Document& json, const std::string& key, json::DecimalEncoding encoding) const;
};

//-------------------------------------------------------------------------

}  // namespace cashdesk::ledger

//-------------------------------------------------------------------------
