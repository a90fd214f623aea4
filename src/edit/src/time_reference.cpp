// SPDX-License-Identifier: Apache-2.0
#include <regex>

#include <fmt/format.h>

#include "cuecraft/edit/time_reference.hpp"
#include "cuecraft/error.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::utility;

namespace {

std::optional<double> parse_colon_groups(const std::string &value) {
    const auto parts = split(value, ':');

    if (parts.size() != 2 and parts.size() != 3)
        return {};

    std::vector<double> groups;
    for (const auto &i : parts) {
        auto group = to_double(i);
        if (not group)
            return {};
        groups.push_back(*group);
    }

    if (groups.size() == 2)
        return groups[0] * 60.0 + groups[1];

    return groups[0] * 3600.0 + groups[1] * 60.0 + groups[2];
}

double search_unit(const std::string &value, const std::regex &re, const double scale) {
    std::smatch match;
    if (std::regex_search(value, match, re)) {
        if (auto amount = to_double(match[1].str()))
            return *amount * scale;
    }
    return 0.0;
}

} // namespace

std::optional<double> cuecraft::edit::try_parse_time_reference(const std::string &text) {
    static const std::regex hours_re(R"((\d+)\s*(?:hour|hr|h))");
    static const std::regex minutes_re(R"((\d+)\s*(?:minute|min|m))");
    static const std::regex seconds_re(R"((\d+(?:\.\d+)?)\s*(?:second|sec|s))");

    const auto value = to_lower(trim(text));

    if (value.find(':') != std::string::npos) {
        if (auto seconds = parse_colon_groups(value))
            return seconds;
    }

    auto total = search_unit(value, hours_re, 3600.0) + search_unit(value, minutes_re, 60.0) +
                 search_unit(value, seconds_re, 1.0);

    if (total == 0.0) {
        if (auto bare = to_double(value))
            total = *bare;
    }

    if (total > 0.0)
        return total;

    return {};
}

double cuecraft::edit::parse_time_reference(const std::string &text) {
    auto result = try_parse_time_reference(text);
    if (not result)
        throw time_parse_error(fmt::format("Unrecognised time reference \"{}\"", text));
    return *result;
}
