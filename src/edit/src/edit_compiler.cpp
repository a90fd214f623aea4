// SPDX-License-Identifier: Apache-2.0
#include <cmath>

#include <fmt/format.h>

#include "cuecraft/edit/edit_compiler.hpp"
#include "cuecraft/edit/time_reference.hpp"
#include "cuecraft/error.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::subtitle;

namespace {

StyleChange style_change(const EditParams &params) {
    StyleChange change;

    if (params.font_size.present() and not valid_font_size(*params.font_size.get()))
        throw compile_error(fmt::format(
            "Font size {} outside {}-{}",
            *params.font_size.get(),
            MIN_FONT_SIZE,
            MAX_FONT_SIZE));

    change.font_family      = params.font_family.get();
    change.font_size        = params.font_size.get();
    change.font_color       = params.font_color.get();
    change.position         = params.position.get();
    change.background_color = params.background_color.get();
    change.bold             = params.bold.get();
    change.italic           = params.italic.get();

    return change;
}

double required_time(const Param<std::string> &param, const char *name) {
    auto seconds = try_parse_time_reference(*param.get());
    if (not seconds)
        throw compile_error(fmt::format("Cannot read {} \"{}\"", name, *param.get()));
    return *seconds;
}

} // namespace

std::string cuecraft::edit::normalise_intent(const std::string &raw) {
    return utility::to_lower(utility::trim(raw));
}

EditCompiler::EditCompiler(Style default_style, const double default_duration)
    : default_style_(std::move(default_style)), default_duration_(default_duration) {}

Mutation EditCompiler::compile(
    const std::string &intent, const EditParams &params, const Timeline &timeline) const {

    const auto has_ordinal = params.subtitle_index.present();

    if (intent == INTENT_ADD_SUBTITLE or (intent == INTENT_MODIFY_STYLE and not has_ordinal))
        return compile_insert(params);

    if (intent == INTENT_MODIFY_SUBTITLE or intent == INTENT_MODIFY_STYLE) {
        auto update = compile_update(params);
        spdlog::debug(
            "Compiled update of {} against {} subtitles", update.index, timeline.size());
        return update;
    }

    spdlog::debug("Intent \"{}\" carries no edit", intent);
    return NoMutation();
}

Mutation EditCompiler::compile(
    const std::string &intent, const std::string &raw_params, const Timeline &timeline) const {
    return compile(intent, EditParams::from_text(raw_params), timeline);
}

InsertMutation EditCompiler::compile_insert(const EditParams &params) const {
    InsertMutation result;

    result.text = params.text.value_or("");

    // negative or non finite times read as unparseable
    const auto usable = [](const std::optional<double> &t) {
        return t and std::isfinite(*t) and *t >= 0.0;
    };

    std::optional<double> start;
    if (params.start_time.present())
        start = try_parse_time_reference(*params.start_time.get());
    if (not usable(start))
        start = 0.0;

    std::optional<double> end;
    if (params.end_time.present())
        end = try_parse_time_reference(*params.end_time.get());
    if (not usable(end) or *end <= *start)
        end = *start + default_duration_;

    // start too large for the default duration to register
    if (not std::isfinite(*end) or *end <= *start) {
        spdlog::debug("Start {} out of range, using 0", *start);
        start = 0.0;
        end   = default_duration_;
    }

    result.start_time = *start;
    result.end_time   = *end;

    result.style = style_change(params).applied_to(default_style_);

    return result;
}

UpdateMutation EditCompiler::compile_update(const EditParams &params) const {
    UpdateMutation result;

    result.index = params.subtitle_index.value_or(-1);
    result.text  = params.text.get();

    if (params.start_time.present())
        result.start_time = required_time(params.start_time, "start_time");
    if (params.end_time.present())
        result.end_time = required_time(params.end_time, "end_time");

    result.style = style_change(params);

    return result;
}
