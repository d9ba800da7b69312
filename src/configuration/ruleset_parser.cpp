// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "configuration/common.hpp"
#include "configuration/ruleset_parser.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "pattern_validator.hpp"
#include "ruleset_info.hpp"
#include "scope_types.hpp"
#include "version.hpp"

namespace scopematch {

namespace {

unsigned parse_schema_version(std::string_view version)
{
    auto dot_pos = version.find('.');
    if (dot_pos != std::string_view::npos) {
        version.remove_suffix(version.size() - dot_pos);
    }

    unsigned major = 0;
    const char *data = version.data();
    const char *end = data + version.size();
    auto [ptr, ec] = std::from_chars(data, end, major);
    if (version.empty() || ec != std::errc{} || ptr != end) {
        throw parsing_error("invalid version format, expected major.minor");
    }

    return major;
}

target_type parse_target_type(const YAML::Node &node)
{
    auto type_str = at<std::string>(node, "type");
    auto type = target_type_from_string(type_str);
    if (!type.has_value()) {
        throw parsing_error("unknown target type '" + type_str + "'");
    }
    return *type;
}

target_status parse_status(const YAML::Node &node)
{
    auto status_str = at<std::string>(node, "status", "active");
    auto status = target_status_from_string(status_str);
    if (!status.has_value()) {
        throw parsing_error("unknown status '" + status_str + "'");
    }
    return *status;
}

std::string parse_pattern(const YAML::Node &node, target_type type)
{
    auto pattern = at<std::string>(node, "pattern");
    if (auto error = validate_target_pattern(type, pattern); error.has_value()) {
        throw parsing_error(*error);
    }
    return pattern;
}

scope_target parse_target(const YAML::Node &node, std::string id)
{
    scope_target target;
    target.id = std::move(id);
    target.type = parse_target_type(node);
    target.pattern = parse_pattern(node, target.type);
    target.status = parse_status(node);
    target.description = at<std::string>(node, "description", {});

    auto priority_str = at<std::string>(node, "priority", "none");
    auto priority = target_priority_from_string(priority_str);
    if (!priority.has_value()) {
        throw parsing_error("unknown priority '" + priority_str + "'");
    }
    target.priority = *priority;

    return target;
}

scope_exclusion parse_exclusion(const YAML::Node &node, std::string id)
{
    scope_exclusion exclusion;
    exclusion.id = std::move(id);
    exclusion.type = parse_target_type(node);
    exclusion.pattern = parse_pattern(node, exclusion.type);
    exclusion.status = parse_status(node);
    exclusion.reason = at<std::string>(node, "reason", {});
    return exclusion;
}

// Shared loop for targets and exclusions, each item is parsed independently
// so that a single malformed rule doesn't invalidate the rest.
template <typename T, typename Fn>
std::vector<T> parse_rules(const YAML::Node &array, std::string_view kind,
    ruleset_info::section_info &info, Fn &&parse_fn)
{
    std::vector<T> rules;
    std::unordered_set<std::string> ids;

    for (unsigned i = 0; i < array.size(); ++i) {
        const YAML::Node node = array[i];
        std::string id;
        try {
            if (!node.IsMap()) {
                throw parsing_error(std::string{kind} + " must be a map");
            }

            id = at<std::string>(node, "id");
            if (ids.contains(id)) {
                SCOPEMATCH_WARN("Duplicate {}: {}", kind, id);
                info.add_failed(id, "duplicate " + std::string{kind});
                continue;
            }

            rules.emplace_back(parse_fn(node, id));
            ids.emplace(id);

            SCOPEMATCH_DEBUG("Parsed {} {}", kind, id);
            info.add_loaded(id);
        } catch (const std::exception &e) {
            SCOPEMATCH_WARN("Failed to parse {} '{}': {}", kind, id, e.what());
            info.add_failed(i, id, e.what());
        }
    }

    return rules;
}

engine_settings parse_settings(const YAML::Node &node)
{
    engine_settings settings;
    if (!node.IsDefined() || node.IsNull()) {
        return settings;
    }

    if (!node.IsMap()) {
        throw invalid_type("settings", "map");
    }

    const YAML::Node cache = node["cache"];
    if (!cache.IsDefined() || cache.IsNull()) {
        return settings;
    }

    if (!cache.IsMap()) {
        throw invalid_type("cache", "map");
    }

    auto ttl_ms =
        at<uint64_t>(cache, "ttl_ms", static_cast<uint64_t>(settings.cache_ttl.count()));
    if (ttl_ms > static_cast<uint64_t>(std::chrono::milliseconds::max().count())) {
        throw invalid_type("ttl_ms", "unsigned integer within range");
    }
    settings.cache_ttl = std::chrono::milliseconds{static_cast<int64_t>(ttl_ms)};
    settings.cache_capacity = at<uint64_t>(cache, "capacity", settings.cache_capacity);

    return settings;
}

asset parse_asset(const YAML::Node &node, std::string id)
{
    asset a;
    a.id = std::move(id);
    a.type = at<std::string>(node, "type");
    a.name = at<std::string>(node, "name", {});

    const YAML::Node metadata = node["metadata"];
    if (metadata.IsDefined() && !metadata.IsNull()) {
        if (!metadata.IsMap()) {
            throw invalid_type("metadata", "map");
        }

        for (const auto &kv : metadata) {
            // Only scalars can be used as candidate values
            if (!kv.second.IsScalar()) {
                continue;
            }
            a.metadata.emplace(kv.first.as<std::string>(), kv.second.as<std::string>());
        }
    }

    return a;
}

} // namespace

scope_ruleset parse_ruleset(const YAML::Node &root, ruleset_info &info)
{
    if (!root.IsMap()) {
        throw parsing_error("ruleset must be a map");
    }

    auto version = at<std::string>(root, "version", "1.0");
    if (parse_schema_version(version) != ruleset_schema_major) {
        throw parsing_error("unsupported ruleset version " + version);
    }
    info.set_ruleset_version(version);

    const YAML::Node targets = root["targets"];
    const YAML::Node exclusions = root["exclusions"];
    if (!targets.IsDefined() && !exclusions.IsDefined()) {
        throw parsing_error("no targets or exclusions");
    }

    scope_ruleset ruleset;
    ruleset.settings = parse_settings(root["settings"]);

    if (targets.IsDefined()) {
        auto &section = info.add_section("targets");
        if (targets.IsSequence()) {
            ruleset.targets =
                parse_rules<scope_target>(targets, "target", section, parse_target);
        } else {
            SCOPEMATCH_WARN("Invalid targets section, expected sequence");
            section.set_error("invalid type for key 'targets', expected sequence");
        }
    }

    if (exclusions.IsDefined()) {
        auto &section = info.add_section("exclusions");
        if (exclusions.IsSequence()) {
            ruleset.exclusions =
                parse_rules<scope_exclusion>(exclusions, "exclusion", section, parse_exclusion);
        } else {
            SCOPEMATCH_WARN("Invalid exclusions section, expected sequence");
            section.set_error("invalid type for key 'exclusions', expected sequence");
        }
    }

    SCOPEMATCH_INFO("Loaded ruleset with {} targets and {} exclusions", ruleset.targets.size(),
        ruleset.exclusions.size());

    return ruleset;
}

std::vector<asset> parse_assets(const YAML::Node &root, ruleset_info::section_info &info)
{
    const YAML::Node array = root.IsMap() ? root["assets"] : root;

    if (!array.IsDefined() || !array.IsSequence()) {
        throw parsing_error("assets must be a sequence");
    }

    return parse_rules<asset>(array, "asset", info, parse_asset);
}

YAML::Node load_document(std::string_view contents)
{
    try {
        return YAML::Load(std::string{contents});
    } catch (const YAML::Exception &e) {
        throw parsing_error(std::string{"malformed document: "} + e.what());
    }
}

} // namespace scopematch
