// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace global_store {

    const std::string PREF_DEFAULT_FONT_FAMILY{"/core/subtitle/default_font_family"};
    const std::string PREF_DEFAULT_FONT_SIZE{"/core/subtitle/default_font_size"};
    const std::string PREF_DEFAULT_FONT_COLOR{"/core/subtitle/default_font_color"};
    const std::string PREF_DEFAULT_POSITION{"/core/subtitle/default_position"};
    const std::string PREF_DEFAULT_DURATION{"/core/subtitle/default_duration"};
    const std::string PREF_NOISE_THRESHOLD{"/core/silence/noise_threshold"};
    const std::string PREF_MIN_SILENCE_DURATION{"/core/silence/min_silence_duration"};
    const std::string PREF_LOG_NAME{"/core/logging/name"};
    const std::string PREF_LOG_PATTERN{"/core/logging/pattern"};
    const std::string PREF_LOG_MAX_FILE_SIZE{"/core/logging/max_file_size_mb"};
    const std::string PREF_LOG_MAX_FILES{"/core/logging/max_files"};

    template <typename result_type>
    inline result_type preference_property(
        const utility::JsonStore &js, const std::string &path, const std::string &prop) {
        return js.get(path + "/" + prop);
    }

    template <typename result_type>
    inline result_type preference_value(const utility::JsonStore &js, const std::string &path) {
        if (js.get(path + "/value").is_null())
            return preference_property<result_type>(js, path, "default_value");
        return preference_property<result_type>(js, path, "value");
    }

    template <typename result_type>
    inline result_type
    preference_default_value(const utility::JsonStore &js, const std::string &path) {
        return preference_property<result_type>(js, path, "default_value");
    }

    inline std::string
    preference_description(const utility::JsonStore &js, const std::string &path) {
        return preference_property<std::string>(js, path, "description");
    }

    inline std::string
    preference_datatype(const utility::JsonStore &js, const std::string &path) {
        return preference_property<std::string>(js, path, "datatype");
    }

    template <typename value_type>
    inline void set_preference_value(
        utility::JsonStore &js, const value_type &value, const std::string &path) {
        js.set(value, path + "/value");
    }

    //! Value, or fallback when the preference is missing or of the wrong type.
    template <typename result_type>
    inline result_type preference_value_or(
        const utility::JsonStore &js, const std::string &path, const result_type &fallback) {
        try {
            return preference_value<result_type>(js, path);
        } catch (const std::exception &err) {
            spdlog::debug("{} {} {}", __PRETTY_FUNCTION__, path, err.what());
        }
        return fallback;
    }

    //! Merge every *.json below each path, later paths override earlier ones.
    utility::JsonStore global_store_builder(
        const std::vector<std::string> &paths,
        const utility::JsonStore &json = utility::JsonStore());

    //! Shipped defaults followed by $CUECRAFT_PREF_PATH entries (':' separated).
    std::vector<std::string> default_preference_paths();

    //! Style used for attributes an edit does not specify.
    subtitle::Style default_style(const utility::JsonStore &js);

    double default_duration(const utility::JsonStore &js);

    std::string noise_threshold(const utility::JsonStore &js);

    double min_silence_duration(const utility::JsonStore &js);

    //! Logger name, pattern and logfile rotation, unset or invalid entries keep the defaults.
    utility::LogSettings log_settings(const utility::JsonStore &js);

} // namespace global_store
} // namespace cuecraft
