// SPDX-License-Identifier: Apache-2.0
#include <fmt/format.h>

#include "cuecraft/error.hpp"
#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

std::string cuecraft::subtitle::to_string(const SubtitlePosition position) {
    switch (position) {
    case SP_TOP:
        return "top";
    case SP_CENTER:
        return "center";
    case SP_BOTTOM:
    default:
        return "bottom";
    }
}

std::optional<SubtitlePosition>
cuecraft::subtitle::position_from_string(const std::string &value) {
    const auto lower = to_lower(trim(value));

    if (lower == "top")
        return SP_TOP;
    if (lower == "center" or lower == "centre" or lower == "middle")
        return SP_CENTER;
    if (lower == "bottom")
        return SP_BOTTOM;

    return {};
}

Style::Style(
    std::string font_family,
    const int font_size,
    std::string font_color,
    const SubtitlePosition position,
    const bool bold,
    const bool italic,
    std::optional<std::string> background_color)
    : font_family_(std::move(font_family)),
      font_size_(font_size),
      font_color_(std::move(font_color)),
      position_(position),
      background_color_(std::move(background_color)),
      bold_(bold),
      italic_(italic) {}

Style::Style(const JsonStore &jsn) {
    font_family_ = jsn.value("font_family", font_family_);
    font_size_   = jsn.value("font_size", font_size_);
    font_color_  = jsn.value("font_color", font_color_);
    bold_        = jsn.value("bold", bold_);
    italic_      = jsn.value("italic", italic_);

    if (jsn.count("position")) {
        auto pos = position_from_string(jsn.at("position").get<std::string>());
        if (not pos)
            throw cuecraft_err(
                fmt::format("Invalid position {}", jsn.at("position").get<std::string>()));
        position_ = *pos;
    }

    if (jsn.count("background_color") and not jsn.at("background_color").is_null())
        background_color_ = jsn.at("background_color").get<std::string>();
}

JsonStore Style::serialise() const {
    JsonStore jsn;

    jsn["font_family"] = font_family_;
    jsn["font_size"]   = font_size_;
    jsn["font_color"]  = font_color_;
    jsn["position"]    = to_string(position_);
    jsn["bold"]        = bold_;
    jsn["italic"]      = italic_;

    if (background_color_)
        jsn["background_color"] = *background_color_;
    else
        jsn["background_color"] = nullptr;

    return jsn;
}

std::string cuecraft::subtitle::to_string(const Style &style) {
    return style.serialise().dump();
}
