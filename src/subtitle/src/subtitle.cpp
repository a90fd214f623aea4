// SPDX-License-Identifier: Apache-2.0
#include "cuecraft/subtitle/subtitle.hpp"

using namespace cuecraft;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

Subtitle::Subtitle(
    std::string id,
    std::string text,
    const double start_time,
    const double end_time,
    Style style)
    : id_(std::move(id)),
      text_(std::move(text)),
      start_time_(start_time),
      end_time_(end_time),
      style_(std::move(style)) {}

Subtitle::Subtitle(const JsonStore &jsn) {
    id_         = jsn.at("id").get<std::string>();
    text_       = jsn.value("text", "");
    start_time_ = jsn.at("start_time").get<double>();
    end_time_   = jsn.at("end_time").get<double>();

    if (jsn.count("style") and jsn.at("style").is_object())
        style_ = Style(JsonStore(jsn.at("style")));
}

JsonStore Subtitle::serialise() const {
    JsonStore jsn;

    jsn["id"]         = id_;
    jsn["text"]       = text_;
    jsn["start_time"] = start_time_;
    jsn["end_time"]   = end_time_;
    jsn["style"]      = style_.serialise();

    return jsn;
}

Subtitles cuecraft::subtitle::subtitles_from_json(const JsonStore &jsn) {
    Subtitles result;

    if (jsn.is_null())
        return result;

    for (const auto &i : jsn)
        result.emplace_back(JsonStore(i));

    return result;
}
