// SPDX-License-Identifier: Apache-2.0
#include <cstdlib>

#include "cuecraft/edit/edit_compiler.hpp"
#include "cuecraft/global_store/global_store.hpp"
#include "cuecraft/silence/silence_log.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::global_store;
using namespace cuecraft::utility;

#ifndef CUECRAFT_PREFERENCE_DIR
#define CUECRAFT_PREFERENCE_DIR "share/preference"
#endif

utility::JsonStore cuecraft::global_store::global_store_builder(
    const std::vector<std::string> &paths, const utility::JsonStore &json) {
    // find json and merge non destructively.
    utility::JsonStore merged = json;

    for (const auto &path : paths)
        merged.merge(merge_json_from_path(path));

    return merged;
}

std::vector<std::string> cuecraft::global_store::default_preference_paths() {
    std::vector<std::string> paths{CUECRAFT_PREFERENCE_DIR};

    if (const char *env = std::getenv("CUECRAFT_PREF_PATH")) {
        for (const auto &i : split(env, ':')) {
            if (not i.empty())
                paths.push_back(i);
        }
    }

    return paths;
}

subtitle::Style cuecraft::global_store::default_style(const utility::JsonStore &js) {
    const auto fallback = subtitle::Style();
    auto style          = fallback;

    style.set_font_family(
        preference_value_or<std::string>(js, PREF_DEFAULT_FONT_FAMILY, fallback.font_family()));
    style.set_font_color(
        preference_value_or<std::string>(js, PREF_DEFAULT_FONT_COLOR, fallback.font_color()));

    const auto size = preference_value_or<int>(js, PREF_DEFAULT_FONT_SIZE, fallback.font_size());
    if (subtitle::valid_font_size(size))
        style.set_font_size(size);
    else
        spdlog::warn("Ignoring default font size {}, outside {}-{}",
            size,
            subtitle::MIN_FONT_SIZE,
            subtitle::MAX_FONT_SIZE);

    const auto position = preference_value_or<std::string>(
        js, PREF_DEFAULT_POSITION, subtitle::to_string(fallback.position()));
    if (auto pos = subtitle::position_from_string(position))
        style.set_position(*pos);
    else
        spdlog::warn("Ignoring default position {}", position);

    return style;
}

double cuecraft::global_store::default_duration(const utility::JsonStore &js) {
    const auto duration =
        preference_value_or<double>(js, PREF_DEFAULT_DURATION, edit::DEFAULT_SUBTITLE_DURATION);

    if (duration > 0.0)
        return duration;

    spdlog::warn("Ignoring default duration {}", duration);
    return edit::DEFAULT_SUBTITLE_DURATION;
}

std::string cuecraft::global_store::noise_threshold(const utility::JsonStore &js) {
    return preference_value_or<std::string>(
        js, PREF_NOISE_THRESHOLD, silence::DEFAULT_NOISE_THRESHOLD);
}

double cuecraft::global_store::min_silence_duration(const utility::JsonStore &js) {
    return preference_value_or<double>(
        js, PREF_MIN_SILENCE_DURATION, silence::DEFAULT_MIN_SILENCE_DURATION);
}

utility::LogSettings cuecraft::global_store::log_settings(const utility::JsonStore &js) {
    const auto fallback = utility::LogSettings();
    auto settings       = fallback;

    settings.name = preference_value_or<std::string>(js, PREF_LOG_NAME, fallback.name);
    if (settings.name.empty())
        settings.name = fallback.name;

    settings.pattern = preference_value_or<std::string>(js, PREF_LOG_PATTERN, fallback.pattern);
    if (settings.pattern.empty())
        settings.pattern = fallback.pattern;

    const auto size_mb = preference_value_or<int>(js, PREF_LOG_MAX_FILE_SIZE, 0);
    if (size_mb > 0)
        settings.max_file_size = static_cast<size_t>(size_mb) * 1024 * 1024;

    const auto files = preference_value_or<int>(js, PREF_LOG_MAX_FILES, 0);
    if (files > 0)
        settings.max_files = static_cast<size_t>(files);

    return settings;
}
