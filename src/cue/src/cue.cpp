// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <cmath>
#include <map>
#include <tuple>

#include <fmt/format.h>

#include "cuecraft/cue/cue.hpp"
#include "cuecraft/subtitle/timeline.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::cue;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

namespace {
// split a non negative time into whole units of 1/divisor seconds
std::tuple<long long, long long, long long, long long>
split_time(const double seconds, const long long divisor) {
    const auto ticks = std::llround(std::max(seconds, 0.0) * static_cast<double>(divisor));
    const auto total = ticks / divisor;

    return std::make_tuple(total / 3600, (total % 3600) / 60, total % 60, ticks % divisor);
}
} // namespace

JsonStore Cue::serialise() const {
    JsonStore jsn;

    jsn["index"] = index;
    jsn["start"] = start;
    jsn["end"]   = end;
    jsn["text"]  = text;
    jsn["style"] = style.serialise();

    return jsn;
}

Cues cuecraft::cue::make_cues(const Subtitles &subtitles) {
    Cues result;
    size_t index = 1;

    for (const auto &i : chronological(subtitles))
        result.push_back(Cue{index++, i.start_time(), i.end_time(), i.text(), i.style()});

    return result;
}

JsonStore cuecraft::cue::serialise_cues(const Cues &cues) {
    auto result = R"([])"_json;
    for (const auto &i : cues)
        result.emplace_back(i.serialise());
    return result;
}

std::string cuecraft::cue::format_srt_time(const double seconds) {
    const auto [hh, mm, ss, ms] = split_time(seconds, 1000);
    return fmt::format("{:02d}:{:02d}:{:02d},{:03d}", hh, mm, ss, ms);
}

std::string cuecraft::cue::format_ass_time(const double seconds) {
    const auto [hh, mm, ss, cs] = split_time(seconds, 100);
    return fmt::format("{}:{:02d}:{:02d}.{:02d}", hh, mm, ss, cs);
}

std::string cuecraft::cue::colour_to_hex(const std::string &colour) {
    static const std::map<std::string, std::string> colour_map = {
        {"white", "#FFFFFF"},
        {"black", "#000000"},
        {"red", "#FF0000"},
        {"green", "#00FF00"},
        {"blue", "#0000FF"},
        {"yellow", "#FFFF00"},
        {"cyan", "#00FFFF"},
        {"magenta", "#FF00FF"},
        {"orange", "#FFA500"},
        {"purple", "#800080"},
        {"pink", "#FFC0CB"},
        {"brown", "#A52A2A"},
        {"gray", "#808080"},
        {"grey", "#808080"}};

    const auto value = trim(colour);
    if (starts_with(value, "#"))
        return to_upper(value);

    auto it = colour_map.find(to_lower(value));
    if (it == colour_map.end())
        return "#FFFFFF";

    return it->second;
}

std::optional<std::vector<int>> cuecraft::cue::hex_to_rgb(const std::string &hex) {
    auto value = trim(hex);
    if (starts_with(value, "#"))
        value = value.substr(1);

    if (value.size() != 6 or
        value.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
        return {};

    std::vector<int> result;
    for (size_t i = 0; i < 6; i += 2)
        result.push_back(std::stoi(value.substr(i, 2), nullptr, 16));

    return result;
}

std::string cuecraft::cue::ass_colour(const std::string &colour) {
    auto rgb = hex_to_rgb(colour_to_hex(colour));
    if (not rgb)
        rgb = std::vector<int>{255, 255, 255};

    return fmt::format("&H00{:02X}{:02X}{:02X}", (*rgb)[2], (*rgb)[1], (*rgb)[0]);
}

int cuecraft::cue::ass_alignment(const SubtitlePosition position) {
    switch (position) {
    case SP_TOP:
        return 8;
    case SP_CENTER:
        return 5;
    case SP_BOTTOM:
    default:
        return 2;
    }
}

std::string cuecraft::cue::ass_style_name(const Style &style) {
    return fmt::format(
        "{}_{}_{}",
        replace_all(style.font_family(), " ", ""),
        style.font_size(),
        replace_all(style.font_color(), "#", "").substr(0, 6));
}

std::string cuecraft::cue::srt_styled_text(const std::string &text, const Style &style) {
    auto result = text;

    if (style.bold())
        result = "<b>" + result + "</b>";
    if (style.italic())
        result = "<i>" + result + "</i>";

    return result;
}
