/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

//-------------------------------------------------------------------------

// Milliseconds since the Unix epoch.
using Timestamp = uint64_t;

inline constexpr Timestamp TIMESTAMP_INVALID = 0;

using Clock = std::function<Timestamp()>;

[[nodiscard]] inline Timestamp currentTimestamp() noexcept
{
    using namespace std::chrono;
    return static_cast<Timestamp>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

[[nodiscard]] inline std::chrono::sys_time<std::chrono::milliseconds> toTimePoint(
    Timestamp timestamp) noexcept
{
    return std::chrono::sys_time<std::chrono::milliseconds>{
        std::chrono::milliseconds{timestamp}};
}

//-------------------------------------------------------------------------
