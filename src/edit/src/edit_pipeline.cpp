// SPDX-License-Identifier: Apache-2.0
#include <fmt/format.h>

#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

namespace {
const std::string help_text =
    R"(I can help you add and style subtitles! Here are some examples:

- "Add subtitle 'Hello World' from 0 to 5 seconds"
- "Add 'Welcome!' from 1:30 to 1:35 with red color"
- "Add subtitle 'Chapter 1' at 10 seconds for 5 seconds, size 48, bold"
- "Make the last subtitle yellow"

I understand:
- Times: "5 seconds", "1:30", "2 minutes 30 seconds"
- Colors: red, blue, yellow, white, or hex codes like #FF0000
- Fonts: Arial, Helvetica, Roboto, etc.
- Sizes: 12-72 pixels
- Position: top, center, bottom
- Styles: bold, italic)";
}

JsonStore EditResult::serialise() const {
    JsonStore jsn;

    jsn["intent"]   = intent;
    jsn["mutation"] = to_string(kind);
    jsn["count"]    = count;
    jsn["reply"]    = reply;

    if (changed()) {
        jsn["index"]    = index;
        jsn["subtitle"] = subtitle.serialise();
    } else {
        jsn["index"]    = nullptr;
        jsn["subtitle"] = nullptr;
    }

    return jsn;
}

std::string cuecraft::edit::describe(const EditResult &result, const EditParams &params) {
    if (result.kind == MK_INSERT or result.kind == MK_UPDATE) {
        const auto &sub = result.subtitle;
        auto reply      = fmt::format(
            "{} subtitle{}: \"{}\" from {:.1f}s to {:.1f}s",
            result.kind == MK_INSERT ? "Added" : "Updated",
            result.kind == MK_INSERT ? "" : fmt::format(" {}", result.index + 1),
            sub.text(),
            sub.start_time(),
            sub.end_time());

        std::vector<std::string> style_parts;
        if (params.font_color.present())
            style_parts.push_back(fmt::format("color: {}", *params.font_color.get()));
        if (params.font_size.present())
            style_parts.push_back(fmt::format("size: {}px", *params.font_size.get()));
        if (params.font_family.present())
            style_parts.push_back(fmt::format("font: {}", *params.font_family.get()));
        if (params.position.present())
            style_parts.push_back(fmt::format("position: {}", to_string(*params.position.get())));

        if (not style_parts.empty())
            reply += " with " + join_as_string(style_parts, ", ");

        return reply;
    }

    if (result.intent == INTENT_HELP)
        return help_text;

    if (result.intent == INTENT_LIST_SUBTITLES)
        return fmt::format("There are {} subtitles.", result.count);

    return "I'm ready to help you add subtitles!";
}

std::string cuecraft::edit::timeline_context(const Subtitles &subtitles) {
    if (subtitles.empty())
        return "There are no subtitles yet.";

    std::vector<std::string> lines;
    lines.push_back(fmt::format("Current subtitles ({}):", subtitles.size()));

    size_t n = 0;
    for (const auto &i : subtitles)
        lines.push_back(fmt::format(
            "{}. \"{}\" {:.2f}s-{:.2f}s {} {}px {}",
            ++n,
            i.text(),
            i.start_time(),
            i.end_time(),
            i.style().font_color(),
            i.style().font_size(),
            to_string(i.style().position())));

    return join_as_string(lines, "\n");
}

EditResult EditPipeline::run(const OracleReply &reply, Timeline &timeline) const {
    return run(normalise_intent(reply.intent), EditParams::from_text(reply.params), timeline);
}

EditResult EditPipeline::run(
    const std::string &intent, const EditParams &params, Timeline &timeline) const {
    const auto mutation = compiler_.compile(intent, params, timeline);
    const auto applied  = timeline.apply(mutation);

    EditResult result;
    result.intent   = intent;
    result.kind     = applied.kind;
    result.index    = applied.index;
    result.subtitle = applied.subtitle;
    result.count    = timeline.size();
    result.reply    = describe(result, params);

    spdlog::debug("{} {} -> {}", __PRETTY_FUNCTION__, intent, to_string(result.kind));

    return result;
}

EditResult EditPipeline::run(
    IntentOracle &oracle, const std::string &message, Timeline &timeline) const {
    return run(oracle.interpret(message, timeline_context(timeline.subtitles())), timeline);
}
