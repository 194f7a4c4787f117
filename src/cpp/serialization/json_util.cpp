/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace cashdesk::json
{

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

namespace
{

template<typename OutputStream>
void write(const rapidjson::Value& json, OutputStream& os, const FormatOptions& formatOptions)
{
    if (!formatOptions.indent.has_value()) {
        rapidjson::Writer<OutputStream> writer{os};
        writer.SetMaxDecimalPlaces(static_cast<int>(formatOptions.decimals));
        json.Accept(writer);
        return;
    }
    rapidjson::PrettyWriter<OutputStream> writer{os};
    writer.SetIndent(
        formatOptions.indent->indentChar, formatOptions.indent->indentCharCount);
    writer.SetMaxDecimalPlaces(static_cast<int>(formatOptions.decimals));
    json.Accept(writer);
}

// Keeps parse errors readable when the offending input is a whole checkpoint.
[[nodiscard]] std::string_view excerpt(std::string_view text)
{
    static constexpr size_t kMaxChars = 120;
    return text.substr(0, std::min(kMaxChars, text.size()));
}

}  // namespace

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    write(json, buffer, formatOptions);
    return {buffer.GetString(), buffer.GetSize()};
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    json.Parse(str.c_str());
    if (json.HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Malformed JSON at offset {}: '{}{}'",
            std::source_location::current().function_name(),
            json.GetErrorOffset(),
            excerpt(str),
            str.size() > excerpt(str).size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void dumpJson(const rapidjson::Value& json, std::ostream& os, const FormatOptions& formatOptions)
{
    rapidjson::OStreamWrapper osw{os};
    write(json, osw, formatOptions);
}

//-------------------------------------------------------------------------

void writeJsonFile(
    const rapidjson::Value& json, const fs::path& path, const FormatOptions& formatOptions)
{
    const fs::path staging = fs::path{path}.concat(".tmp");
    {
        std::ofstream ofs{staging};
        if (!ofs) {
            throw std::runtime_error{fmt::format(
                "{}: Unable to open '{}' for writing",
                std::source_location::current().function_name(), staging.c_str())};
        }
        dumpJson(json, ofs, formatOptions);
    }
    fs::rename(staging, path);
}

//-------------------------------------------------------------------------

rapidjson::Document loadJson(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::ifstream ifs{path};
    if (!ifs) {
        throw std::invalid_argument{fmt::format("{}: Cannot read '{}'", ctx, path.c_str())};
    }
    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document json;
    json.ParseStream(isw);
    if (json.HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Malformed JSON in '{}' at offset {}", ctx, path.c_str(), json.GetErrorOffset())};
    }
    return json;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    // Checkpoints carry DPD-packed integers, report files plain numbers.
    if (json.IsUint64()) {
        return util::unpackDecimal(json.GetUint64());
    }
    if (json.IsNumber()) {
        return util::double2decimal(json.GetDouble(), kMaxDecimalPlaces);
    }
    throw std::invalid_argument{fmt::format(
        "{}: Expected a decimal amount, got {}",
        std::source_location::current().function_name(),
        json2str(json))};
}

//-------------------------------------------------------------------------

std::optional<decimal_t> getOptionalDecimal(const rapidjson::Value& json)
{
    if (json.IsNull()) return std::nullopt;
    return getDecimal(json);
}

//-------------------------------------------------------------------------

void setDecimalMember(
    rapidjson::Document& json,
    const std::string& key,
    std::optional<decimal_t> value,
    DecimalEncoding encoding)
{
    auto& allocator = json.GetAllocator();
    rapidjson::Value member;
    if (!value.has_value()) {
        member.SetNull();
    } else if (encoding == DecimalEncoding::PACKED) {
        member.SetUint64(util::packDecimal(value.value()));
    } else {
        member.SetDouble(util::decimal2double(value.value()));
    }
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, member, allocator);
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) {
        serializer(json);
        return;
    }
    auto& allocator = json.GetAllocator();
    rapidjson::Document member{&allocator};
    serializer(member);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, member, allocator);
}

//-------------------------------------------------------------------------

}  // namespace cashdesk::json

//-------------------------------------------------------------------------
