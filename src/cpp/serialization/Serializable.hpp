/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

#include <concepts>

//-------------------------------------------------------------------------

namespace cashdesk::json
{

//-------------------------------------------------------------------------

// Human-facing output: decimals as doubles. An empty key serializes into
// the document itself, otherwise into a member of that name.
template<typename T>
concept IsJsonSerializable =
    requires (const T& t, rapidjson::Document& json, const std::string& key) {
        { t.jsonSerialize(json, key) } -> std::same_as<void>;
    };

// Restorable state: decimals packed losslessly, read back by T::fromJson.
template<typename T>
concept IsCheckpointSerializable =
    requires (const T& t, rapidjson::Document& json, const std::string& key) {
        { t.checkpointSerialize(json, key) } -> std::same_as<void>;
    };

//-------------------------------------------------------------------------

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return json2str(json, formatOptions);
}

//-------------------------------------------------------------------------

void saveCheckpointFile(
    const IsCheckpointSerializable auto& serializable, const std::filesystem::path& path)
{
    rapidjson::Document json;
    serializable.checkpointSerialize(json);
    writeJsonFile(json, path, {.indent = IndentOptions{}});
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::json

//-------------------------------------------------------------------------
