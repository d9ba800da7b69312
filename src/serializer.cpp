// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <yaml-cpp/yaml.h>

#include "ruleset_info.hpp"
#include "scope_matcher.hpp"
#include "scope_types.hpp"
#include "serializer.hpp"

namespace scopematch {

namespace {

using json_writer = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(json_writer &writer, std::string_view str)
{
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
}

void write_match_result(json_writer &writer, const scope_match_result &result)
{
    writer.StartObject();
    writer.Key("asset_id");
    write_string(writer, result.asset_id);
    writer.Key("asset_name");
    write_string(writer, result.asset_name);
    writer.Key("asset_type");
    write_string(writer, result.asset_type);

    writer.Key("matched_targets");
    writer.StartArray();
    for (const auto &match : result.matched_targets) {
        writer.StartObject();
        writer.Key("target_id");
        write_string(writer, match.target_id);
        writer.Key("pattern");
        write_string(writer, match.pattern);
        writer.Key("match_type");
        write_string(writer, to_string(match.type));
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("matched_exclusions");
    writer.StartArray();
    for (const auto &match : result.matched_exclusions) {
        writer.StartObject();
        writer.Key("exclusion_id");
        write_string(writer, match.exclusion_id);
        writer.Key("pattern");
        write_string(writer, match.pattern);
        writer.Key("reason");
        write_string(writer, match.reason);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("in_scope");
    writer.Bool(result.in_scope);
    writer.Key("summary");
    write_string(writer, format_scope_match(result));
    writer.EndObject();
}

} // namespace

YAML::Node to_yaml(const scope_match_result &result)
{
    YAML::Node node;
    node["asset_id"] = result.asset_id;
    node["asset_name"] = result.asset_name;
    node["asset_type"] = result.asset_type;

    YAML::Node targets{YAML::NodeType::Sequence};
    for (const auto &match : result.matched_targets) {
        YAML::Node target;
        target["target_id"] = match.target_id;
        target["pattern"] = match.pattern;
        target["match_type"] = std::string{to_string(match.type)};
        targets.push_back(target);
    }
    node["matched_targets"] = targets;

    YAML::Node exclusions{YAML::NodeType::Sequence};
    for (const auto &match : result.matched_exclusions) {
        YAML::Node exclusion;
        exclusion["exclusion_id"] = match.exclusion_id;
        exclusion["pattern"] = match.pattern;
        exclusion["reason"] = match.reason;
        exclusions.push_back(exclusion);
    }
    node["matched_exclusions"] = exclusions;

    node["in_scope"] = result.in_scope;
    node["summary"] = format_scope_match(result);
    return node;
}

YAML::Node to_yaml(const scope_coverage &coverage)
{
    YAML::Node node;
    node["total_assets"] = static_cast<uint64_t>(coverage.total_assets);
    node["in_scope_assets"] = static_cast<uint64_t>(coverage.in_scope_assets);
    node["excluded_assets"] = static_cast<uint64_t>(coverage.excluded_assets);
    node["uncovered_assets"] = static_cast<uint64_t>(coverage.uncovered_assets);
    node["coverage_percent"] = coverage.coverage_percent;

    YAML::Node by_type{YAML::NodeType::Map};
    for (const auto &[type, stats] : coverage.by_type) {
        YAML::Node type_node;
        type_node["total"] = static_cast<uint64_t>(stats.total);
        type_node["in_scope"] = static_cast<uint64_t>(stats.in_scope);
        type_node["excluded"] = static_cast<uint64_t>(stats.excluded);
        by_type[type] = type_node;
    }
    node["by_type"] = by_type;
    return node;
}

YAML::Node to_yaml(const ruleset_info &info)
{
    YAML::Node node{YAML::NodeType::Map};
    if (!info.error().empty()) {
        node["error"] = info.error();
        return node;
    }

    for (const auto &[name, section] : info.sections()) {
        YAML::Node section_node;
        if (!section.error().empty()) {
            section_node["error"] = section.error();
        } else {
            YAML::Node loaded{YAML::NodeType::Sequence};
            for (const auto &id : section.loaded()) { loaded.push_back(id); }
            section_node["loaded"] = loaded;

            YAML::Node failed{YAML::NodeType::Sequence};
            for (const auto &id : section.failed()) { failed.push_back(id); }
            section_node["failed"] = failed;

            YAML::Node errors{YAML::NodeType::Map};
            for (const auto &[error, ids] : section.errors()) {
                YAML::Node error_ids{YAML::NodeType::Sequence};
                for (const auto &id : ids) { error_ids.push_back(id); }
                errors[error] = error_ids;
            }
            section_node["errors"] = errors;
        }
        node[name] = section_node;
    }

    if (!info.ruleset_version().empty()) {
        node["ruleset_version"] = info.ruleset_version();
    }
    return node;
}

YAML::Node to_yaml(std::span<const scope_target> targets)
{
    YAML::Node node{YAML::NodeType::Sequence};
    for (const auto &target : targets) {
        YAML::Node target_node;
        target_node["id"] = target.id;
        target_node["type"] = std::string{to_string(target.type)};
        target_node["pattern"] = target.pattern;
        target_node["status"] = std::string{to_string(target.status)};
        target_node["priority"] = std::string{to_string(target.priority)};
        if (!target.description.empty()) {
            target_node["description"] = target.description;
        }
        node.push_back(target_node);
    }
    return node;
}

std::string to_json(const scope_match_result &result)
{
    rapidjson::StringBuffer buffer;
    json_writer writer(buffer);
    write_match_result(writer, result);
    return {buffer.GetString(), buffer.GetSize()};
}

std::string to_json(const scope_coverage &coverage)
{
    rapidjson::StringBuffer buffer;
    json_writer writer(buffer);

    writer.StartObject();
    writer.Key("total_assets");
    writer.Uint64(coverage.total_assets);
    writer.Key("in_scope_assets");
    writer.Uint64(coverage.in_scope_assets);
    writer.Key("excluded_assets");
    writer.Uint64(coverage.excluded_assets);
    writer.Key("uncovered_assets");
    writer.Uint64(coverage.uncovered_assets);
    writer.Key("coverage_percent");
    writer.Uint(coverage.coverage_percent);

    writer.Key("by_type");
    writer.StartObject();
    for (const auto &[type, stats] : coverage.by_type) {
        write_string(writer, type);
        writer.StartObject();
        writer.Key("total");
        writer.Uint64(stats.total);
        writer.Key("in_scope");
        writer.Uint64(stats.in_scope);
        writer.Key("excluded");
        writer.Uint64(stats.excluded);
        writer.EndObject();
    }
    writer.EndObject();

    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

} // namespace scopematch
