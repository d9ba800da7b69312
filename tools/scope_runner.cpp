// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"
#include "configuration/ruleset_parser.hpp"
#include "coverage_calculator.hpp"
#include "ruleset_info.hpp"
#include "scope_matcher.hpp"
#include "scopematch.h"
#include "serializer.hpp"

namespace {
// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{{"-r", "--ruleset"},
        {"--ruleset", "--ruleset"}, {"-a", "--assets"}, {"--assets", "--assets"},
        {"-i", "--asset"}, {"--asset", "--asset"}, {"-f", "--format"}, {"--format", "--format"},
        {"-t", "--targets"}, {"--targets", "--targets"}, {"-v", "--verbose"},
        {"--verbose", "--verbose"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                continue; // Unknown option
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

void print_yaml(const YAML::Node &node)
{
    YAML::Emitter out(std::cout);
    out.SetIndent(2);
    out.SetMapFormat(YAML::Block);
    out.SetSeqFormat(YAML::Block);
    out << node;
    std::cout << '\n';
}

void print_diagnostics(const scopematch::ruleset_info &info)
{
    YAML::Emitter out(std::cerr);
    out.SetIndent(2);
    out << scopematch::to_yaml(info);
    std::cerr << '\n';
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    if (args.contains("--verbose")) {
        scopematch_set_log_cb(log_cb, SCOPEMATCH_LOG_TRACE);
    } else {
        scopematch_set_log_cb(log_cb, SCOPEMATCH_LOG_OFF);
    }

    const std::vector<std::string> rulesets = args["--ruleset"];
    const std::vector<std::string> inventories = args["--assets"];
    const bool list_targets = args.contains("--targets");
    if (rulesets.size() != 1 || (inventories.size() != 1 && !list_targets)) {
        std::cerr << "Usage: " << argv[0] << " --ruleset <yaml/json file>"
                  << " (--assets <yaml/json file> [--asset <id>..] | --targets)"
                  << " [--format yaml|json] [--verbose]\n";
        return EXIT_FAILURE;
    }

    bool json_output = false;
    if (const auto &format = args["--format"]; !format.empty()) {
        if (format.front() == "json") {
            json_output = true;
        } else if (format.front() != "yaml") {
            std::cerr << "Unsupported format: " << format.front() << '\n';
            return EXIT_FAILURE;
        }
    }

    scopematch::ruleset_info info;
    scopematch::scope_ruleset ruleset;
    std::vector<scopematch::asset> assets;
    try {
        ruleset = scopematch::parse_ruleset(
            scopematch::load_document(read_file(rulesets.front())), info);
        if (info.state() == scopematch::ruleset_info_state::invalid) {
            std::cerr << "Invalid ruleset:\n";
            print_diagnostics(info);
            return EXIT_FAILURE;
        }

        if (list_targets) {
            const std::span<const scopematch::scope_target> targets{ruleset.targets};
            print_yaml(scopematch::to_yaml(targets));
            return EXIT_SUCCESS;
        }

        auto &asset_info = info.add_section("assets");
        assets = scopematch::parse_assets(
            scopematch::load_document(read_file(inventories.front())), asset_info);
        if (!asset_info.failed().empty()) {
            std::cerr << "Some assets could not be loaded:\n";
            print_diagnostics(info);
        }
    } catch (const std::exception &e) {
        std::cerr << "Failed to load configuration: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    const std::vector<std::string> &requested = args["--asset"];
    if (requested.empty()) {
        scopematch::coverage_calculator calculator{ruleset.settings};
        auto coverage = calculator.calculate(assets, ruleset.targets, ruleset.exclusions);
        if (json_output) {
            std::cout << scopematch::to_json(*coverage) << '\n';
        } else {
            print_yaml(scopematch::to_yaml(*coverage));
        }
        return EXIT_SUCCESS;
    }

    int status = EXIT_SUCCESS;
    for (const auto &id : requested) {
        const scopematch::asset *found = nullptr;
        for (const auto &a : assets) {
            if (a.id == id) {
                found = &a;
                break;
            }
        }

        if (found == nullptr) {
            std::cerr << "Unknown asset: " << id << '\n';
            status = EXIT_FAILURE;
            continue;
        }

        auto result = scopematch::get_scope_matches_for_asset(
            *found, ruleset.targets, ruleset.exclusions);
        if (json_output) {
            std::cout << scopematch::to_json(result) << '\n';
        } else {
            print_yaml(scopematch::to_yaml(result));
        }
    }

    return status;
}
