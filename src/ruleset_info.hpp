// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scopematch {

inline std::string index_to_id(unsigned idx) { return "index:" + std::to_string(idx); }

enum class ruleset_info_state : uint8_t { empty, invalid, valid };

// Loading diagnostics, one section per ruleset key
class ruleset_info {
public:
    class section_info {
    public:
        using error_map = std::map<std::string, std::vector<std::string>, std::less<>>;

        section_info() = default;
        ~section_info() = default;
        section_info(const section_info &) = delete;
        section_info(section_info &&) noexcept = default;
        section_info &operator=(const section_info &) = delete;
        section_info &operator=(section_info &&) noexcept = default;

        void set_error(std::string_view error) { error_ = error; }
        void add_loaded(std::string_view id) { loaded_.emplace_back(id); }
        void add_failed(std::string_view id, std::string_view error);
        void add_failed(unsigned index, std::string_view id, std::string_view error)
        {
            if (id.empty()) {
                add_failed(index_to_id(index), error);
            } else {
                add_failed(id, error);
            }
        }

        [[nodiscard]] const std::string &error() const { return error_; }
        [[nodiscard]] const std::vector<std::string> &loaded() const { return loaded_; }
        [[nodiscard]] const std::vector<std::string> &failed() const { return failed_; }
        /** Map from an error string to all the ids for which that error was raised */
        [[nodiscard]] const error_map &errors() const { return errors_; }

        [[nodiscard]] ruleset_info_state state() const noexcept
        {
            if (error_.empty() && !loaded_.empty()) {
                return ruleset_info_state::valid;
            }

            if (!error_.empty() || !failed_.empty()) {
                return ruleset_info_state::invalid;
            }

            return ruleset_info_state::empty;
        }

    protected:
        std::string error_;
        std::vector<std::string> loaded_;
        std::vector<std::string> failed_;
        error_map errors_;
    };

    ruleset_info() = default;
    ~ruleset_info() = default;
    ruleset_info(const ruleset_info &) = delete;
    ruleset_info(ruleset_info &&) noexcept = default;
    ruleset_info &operator=(const ruleset_info &) = delete;
    ruleset_info &operator=(ruleset_info &&) noexcept = default;

    section_info &add_section(std::string_view section)
    {
        auto [it, res] = sections_.emplace(section, section_info{});
        return it->second;
    }

    [[nodiscard]] const section_info *find_section(std::string_view section) const
    {
        auto it = sections_.find(section);
        return it != sections_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] const std::map<std::string, section_info, std::less<>> &sections() const
    {
        return sections_;
    }

    void set_ruleset_version(std::string_view version) { ruleset_version_ = version; }
    [[nodiscard]] const std::string &ruleset_version() const { return ruleset_version_; }

    void set_error(std::string error) { error_ = std::move(error); }
    [[nodiscard]] const std::string &error() const { return error_; }

    [[nodiscard]] ruleset_info_state state() const noexcept;

protected:
    std::string ruleset_version_;
    std::string error_;
    std::map<std::string, section_info, std::less<>> sections_;
};

} // namespace scopematch
