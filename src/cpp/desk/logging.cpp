/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

namespace cashdesk::desk
{

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> makeConsoleLogger(
    const std::string& name, spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

//-------------------------------------------------------------------------

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
    return std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::desk

//-------------------------------------------------------------------------
