// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "cuecraft/error.hpp"
#include "cuecraft/subtitle/timeline.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/uuid.hpp"

using namespace cuecraft;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

std::optional<size_t> cuecraft::subtitle::resolve_index(const long index, const size_t length) {
    const auto n        = static_cast<long>(length);
    const auto resolved = index < 0 ? n + index : index;

    if (resolved < 0 or resolved >= n)
        return {};

    return static_cast<size_t>(resolved);
}

Subtitles cuecraft::subtitle::chronological(const Subtitles &subtitles) {
    auto result = subtitles;
    std::stable_sort(result.begin(), result.end(), [](const auto &a, const auto &b) {
        return a.start_time() < b.start_time();
    });
    return result;
}

Timeline::Timeline(const Subtitles &subtitles) { replace(subtitles); }

Timeline::Timeline(const JsonStore &jsn) {
    replace(subtitles_from_json(JsonStore(jsn.at("subtitles"))));
}

AppliedResult Timeline::apply(const Mutation &mutation) {
    if (const auto *insert = std::get_if<InsertMutation>(&mutation))
        return apply_insert(*insert);

    if (const auto *update = std::get_if<UpdateMutation>(&mutation))
        return apply_update(*update);

    return AppliedResult();
}

AppliedResult Timeline::apply_insert(const InsertMutation &mutation) {
    auto sub = Subtitle(
        generate_id("sub"), mutation.text, mutation.start_time, mutation.end_time, mutation.style);

    if (not sub.valid_timing())
        throw invalid_timing_error(fmt::format(
            "Invalid timing {:.2f}-{:.2f}, end must follow a non negative start",
            sub.start_time(),
            sub.end_time()));

    subtitles_.push_back(sub);
    spdlog::debug("Inserted subtitle {} at {}", sub.id(), subtitles_.size() - 1);

    return AppliedResult{MK_INSERT, subtitles_.size() - 1, sub};
}

AppliedResult Timeline::apply_update(const UpdateMutation &mutation) {
    const auto index = resolve_index(mutation.index, subtitles_.size());

    if (not index)
        throw index_out_of_range_error(fmt::format(
            "Subtitle index {} out of range, timeline holds {} subtitles",
            mutation.index,
            subtitles_.size()));

    // work on a copy so a timing failure leaves the timeline untouched
    auto sub = subtitles_[*index];

    if (mutation.text)
        sub.set_text(*mutation.text);
    if (mutation.start_time)
        sub.set_start_time(*mutation.start_time);
    if (mutation.end_time)
        sub.set_end_time(*mutation.end_time);
    sub.set_style(mutation.style.applied_to(sub.style()));

    if (not sub.valid_timing())
        throw invalid_timing_error(fmt::format(
            "Invalid timing {:.2f}-{:.2f} for subtitle {}",
            sub.start_time(),
            sub.end_time(),
            sub.id()));

    subtitles_[*index] = sub;
    spdlog::debug("Updated subtitle {} at {}", sub.id(), *index);

    return AppliedResult{MK_UPDATE, *index, sub};
}

size_t Timeline::replace(const Subtitles &subtitles) {
    Subtitles kept;
    kept.reserve(subtitles.size());

    std::copy_if(subtitles.begin(), subtitles.end(), std::back_inserter(kept), [](const auto &i) {
        return i.valid();
    });

    if (kept.size() != subtitles.size())
        spdlog::debug("Dropped {} invalid subtitles", subtitles.size() - kept.size());

    subtitles_ = std::move(kept);
    return subtitles_.size();
}

std::vector<std::string> Timeline::validate() const {
    std::vector<std::string> issues;
    const auto sorted = chronological();

    for (size_t i = 0; i < sorted.size(); i++) {
        const auto &sub = sorted[i];

        if (sub.end_time() <= sub.start_time())
            issues.emplace_back(fmt::format(
                "Subtitle {}: End time ({}) must be after start time ({})",
                sub.id(),
                sub.end_time(),
                sub.start_time()));

        if (sub.start_time() < 0.0 or sub.end_time() < 0.0)
            issues.emplace_back(fmt::format("Subtitle {}: Times cannot be negative", sub.id()));

        if (i + 1 < sorted.size() and sub.end_time() > sorted[i + 1].start_time())
            issues.emplace_back(
                fmt::format("Subtitle {} overlaps with {}", sub.id(), sorted[i + 1].id()));
    }

    return issues;
}

JsonStore Timeline::serialise() const {
    JsonStore jsn;
    jsn["subtitles"] = serialise_subtitles(subtitles_);
    return jsn;
}
