/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

// Operational log on stdout; one logger per desk, never registered globally.
[[nodiscard]] std::shared_ptr<spdlog::logger> makeConsoleLogger(
    const std::string& name, spdlog::level::level_enum level);

[[nodiscard]] std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name);

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
