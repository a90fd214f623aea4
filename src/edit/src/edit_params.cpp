// SPDX-License-Identifier: Apache-2.0
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <regex>

#include <fmt/format.h>

#include "cuecraft/edit/edit_params.hpp"
#include "cuecraft/error.hpp"
#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::utility;

namespace {

const nlohmann::json *find_field(const JsonStore &jsn, const std::string &key) {
    auto it = jsn.find(key);
    if (it == jsn.end())
        return nullptr;
    return &(*it);
}

Param<std::string> string_param(const JsonStore &jsn, const std::string &key) {
    const auto *value = find_field(jsn, key);

    if (not value)
        return {};
    if (value->is_null())
        return Param<std::string>::null();

    std::string result;
    if (value->is_string())
        result = value->get<std::string>();
    else if (value->is_number() or value->is_boolean())
        result = value->dump();
    else
        throw compile_error(fmt::format("Parameter {} must be text, got {}", key, value->dump()));

    if (trim(result).empty())
        return Param<std::string>::null();

    return result;
}

// whole numbers only, anything outside long throws
std::optional<long> integral(const nlohmann::json &value, const std::string &key) {
    const auto out_of_range = [&]() {
        return compile_error(fmt::format("Parameter {} out of range, got {}", key, value.dump()));
    };

    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<long>::max()))
            throw out_of_range();
        return static_cast<long>(value.get<std::uint64_t>());
    }

    if (value.is_number_integer())
        return value.get<long>();

    if (value.is_number_float()) {
        const auto dbl = value.get<double>();
        if (not std::isfinite(dbl) or std::floor(dbl) != dbl)
            return {};
        // max() rounds up to 2^63 as a double, hence the strict bound
        if (dbl < static_cast<double>(std::numeric_limits<long>::min()) or
            dbl >= static_cast<double>(std::numeric_limits<long>::max()))
            throw out_of_range();
        return static_cast<long>(dbl);
    }

    return {};
}

Param<int> int_param(const JsonStore &jsn, const std::string &key) {
    const auto *value = find_field(jsn, key);

    if (not value)
        return {};
    if (value->is_null())
        return Param<int>::null();

    std::optional<long> result;
    if (value->is_string()) {
        if (trim(value->get<std::string>()).empty())
            return Param<int>::null();
        // "48px"
        auto text = to_lower(trim(value->get<std::string>()));
        if (ends_with(text, "px"))
            text = text.substr(0, text.size() - 2);
        result = to_long(text);
    } else if (not value->is_boolean()) {
        result = integral(*value, key);
    }

    if (not result)
        throw compile_error(
            fmt::format("Parameter {} must be a whole number, got {}", key, value->dump()));

    if (*result < std::numeric_limits<int>::min() or *result > std::numeric_limits<int>::max())
        throw compile_error(fmt::format("Parameter {} out of range, got {}", key, value->dump()));

    return static_cast<int>(*result);
}

Param<bool> bool_param(const JsonStore &jsn, const std::string &key) {
    const auto *value = find_field(jsn, key);

    if (not value)
        return {};
    if (value->is_null())
        return Param<bool>::null();
    if (value->is_boolean())
        return value->get<bool>();

    if (value->is_number_integer()) {
        const auto num = value->get<long>();
        if (num == 0 or num == 1)
            return num == 1;
    } else if (value->is_string()) {
        const auto text = to_lower(trim(value->get<std::string>()));
        if (text.empty())
            return Param<bool>::null();
        if (text == "true" or text == "yes" or text == "on" or text == "1")
            return true;
        if (text == "false" or text == "no" or text == "off" or text == "0")
            return false;
    }

    throw compile_error(
        fmt::format("Parameter {} must be true or false, got {}", key, value->dump()));
}

Param<subtitle::SubtitlePosition> position_param(const JsonStore &jsn, const std::string &key) {
    const auto text = string_param(jsn, key);

    if (text.absent())
        return {};
    if (text.is_null())
        return Param<subtitle::SubtitlePosition>::null();

    auto position = subtitle::position_from_string(*text.get());
    if (not position)
        throw compile_error(fmt::format(
            "Parameter {} must be top, center or bottom, got \"{}\"", key, *text.get()));

    return *position;
}

Param<long> index_param(const JsonStore &jsn, const std::string &key) {
    const auto *value = find_field(jsn, key);

    if (not value)
        return {};
    if (value->is_null())
        return Param<long>::null();

    std::optional<long> result;
    if (value->is_string()) {
        if (trim(value->get<std::string>()).empty())
            return Param<long>::null();
        result = parse_ordinal(value->get<std::string>());
    } else if (not value->is_boolean()) {
        result = integral(*value, key);
    }

    if (not result)
        throw compile_error(
            fmt::format("Parameter {} is not a subtitle position, got {}", key, value->dump()));

    return *result;
}

template <typename T>
void serialise_param(JsonStore &jsn, const std::string &key, const Param<T> &param) {
    if (param.present())
        jsn[key] = *param.get();
}

} // namespace

std::optional<long> cuecraft::edit::parse_ordinal(const std::string &text) {
    static const std::map<std::string, long> words = {
        {"first", 0},
        {"second", 1},
        {"third", 2},
        {"fourth", 3},
        {"fifth", 4},
        {"sixth", 5},
        {"seventh", 6},
        {"eighth", 7},
        {"ninth", 8},
        {"tenth", 9},
        {"last", -1},
        {"final", -1},
        {"penultimate", -2},
        {"second to last", -2},
        {"second-to-last", -2},
        {"second last", -2}};
    static const std::regex numbered_re(R"(^(\d+)(?:st|nd|rd|th)$)");

    auto value = to_lower(trim(text));

    if (auto number = to_long(value))
        return number;

    if (auto it = words.find(value); it != words.end())
        return it->second;

    std::smatch match;
    if (std::regex_match(value, match, numbered_re)) {
        if (auto number = to_long(match[1].str()); number and *number > 0)
            return *number - 1;
    }

    return {};
}

EditParams EditParams::from_json(const JsonStore &jsn) {
    EditParams result;

    if (not jsn.is_object())
        return result;

    result.text             = string_param(jsn, "text");
    result.start_time       = string_param(jsn, "start_time");
    result.end_time         = string_param(jsn, "end_time");
    result.font_family      = string_param(jsn, "font_family");
    result.font_size        = int_param(jsn, "font_size");
    result.font_color       = string_param(jsn, "font_color");
    result.position         = position_param(jsn, "position");
    result.background_color = string_param(jsn, "background_color");
    result.bold             = bool_param(jsn, "bold");
    result.italic           = bool_param(jsn, "italic");
    result.subtitle_index   = index_param(jsn, "subtitle_index");

    return result;
}

EditParams EditParams::from_text(const std::string &raw) {
    static const std::regex object_re(R"(\{[^}]+\})");

    try {
        return from_json(JsonStore(nlohmann::json::parse(trim(raw))));
    } catch (const nlohmann::json::parse_error &err) {
        spdlog::debug("{} {}", __PRETTY_FUNCTION__, err.what());
    }

    std::smatch match;
    if (std::regex_search(raw, match, object_re)) {
        try {
            return from_json(JsonStore(nlohmann::json::parse(match[0].str())));
        } catch (const nlohmann::json::parse_error &err) {
            spdlog::debug("{} {}", __PRETTY_FUNCTION__, err.what());
        }
    }

    spdlog::warn("No parameters recovered from oracle output \"{}\"", raw);
    return EditParams();
}

JsonStore EditParams::serialise() const {
    JsonStore jsn(R"({})"_json);

    serialise_param(jsn, "text", text);
    serialise_param(jsn, "start_time", start_time);
    serialise_param(jsn, "end_time", end_time);
    serialise_param(jsn, "font_family", font_family);
    serialise_param(jsn, "font_size", font_size);
    serialise_param(jsn, "font_color", font_color);
    if (position.present())
        jsn["position"] = subtitle::to_string(*position.get());
    serialise_param(jsn, "background_color", background_color);
    serialise_param(jsn, "bold", bold);
    serialise_param(jsn, "italic", italic);
    serialise_param(jsn, "subtitle_index", subtitle_index);

    return jsn;
}
