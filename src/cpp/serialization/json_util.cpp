/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <fmt/format.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace gemledger::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions)
{
    const auto& [indent] = formatOptions;
    rapidjson::OStreamWrapper osw{ofs};
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{osw};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
        return;
    }
    rapidjson::Writer writer{osw};
    json.Accept(writer);
}

//-------------------------------------------------------------------------

rapidjson::Document loadJson(const std::filesystem::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }
    std::ifstream ifs{path};
    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document json;
    if (json.ParseStream(isw).HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse Json data from '{}'", ctx, path.c_str())};
    }
    return json;
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

void addString(rapidjson::Document& json, const char* key, const std::string& value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key, allocator}, rapidjson::Value{value.c_str(), allocator}, allocator);
}

//-------------------------------------------------------------------------

void addTimestamp(rapidjson::Document& json, const char* key, Timestamp value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key, allocator},
        rapidjson::Value{static_cast<int64_t>(toEpochMillis(value))},
        allocator);
}

//-------------------------------------------------------------------------

std::string getString(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || !json[key].IsString()) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing string member '{}' in {}",
            std::source_location::current().function_name(),
            key,
            json2str(json))};
    }
    return json[key].GetString();
}

//-------------------------------------------------------------------------

std::optional<std::string> getOptionalString(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || json[key].IsNull()) {
        return std::nullopt;
    }
    return getString(json, key);
}

//-------------------------------------------------------------------------

int64_t getInt64(const rapidjson::Value& json, const char* key)
{
    if (!json.HasMember(key) || !json[key].IsInt64()) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing integer member '{}' in {}",
            std::source_location::current().function_name(),
            key,
            json2str(json))};
    }
    return json[key].GetInt64();
}

//-------------------------------------------------------------------------

Timestamp getTimestamp(const rapidjson::Value& json, const char* key)
{
    return fromEpochMillis(getInt64(json, key));
}

//-------------------------------------------------------------------------

}  // namespace gemledger::json

//-------------------------------------------------------------------------
