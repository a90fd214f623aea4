// SPDX-License-Identifier: Apache-2.0
#include <cmath>
#include <numeric>

#include <fmt/format.h>

#include "cuecraft/silence/silence_compactor.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::silence;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

double cuecraft::silence::round_to(const double value, const int places) {
    const auto scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

KeepIntervals
cuecraft::silence::keep_intervals(const SilenceIntervals &silence, const double total_duration) {
    KeepIntervals result;
    double cursor = 0.0;

    for (const auto &i : silence) {
        if (i.start > cursor)
            result.emplace_back(cursor, i.start);
        cursor = i.end;
    }

    if (cursor < total_duration)
        result.emplace_back(cursor, total_duration);

    return result;
}

double cuecraft::silence::removed_before(const SilenceIntervals &silence, const double t) {
    return std::accumulate(
        silence.begin(), silence.end(), 0.0, [t](const double sum, const auto &i) {
            return i.end <= t ? sum + i.duration() : sum;
        });
}

double cuecraft::silence::remap_time(const SilenceIntervals &silence, const double t) {
    return round_to(t - removed_before(silence, t));
}

Subtitles cuecraft::silence::remap_subtitles(
    const SilenceIntervals &silence, const Subtitles &subtitles) {
    if (silence.empty())
        return subtitles;

    Subtitles result;
    result.reserve(subtitles.size());

    for (const auto &i : subtitles) {
        const auto start = remap_time(silence, i.start_time());
        const auto end   = remap_time(silence, i.end_time());

        if (start >= 0.0 and end > start) {
            auto sub = i;
            sub.set_start_time(start);
            sub.set_end_time(end);
            result.push_back(sub);
        } else {
            spdlog::debug(
                "Dropping subtitle {} remapped to {:.2f}-{:.2f}", i.id(), start, end);
        }
    }

    return result;
}

JsonStore SilenceStats::serialise() const {
    JsonStore jsn;

    jsn["total_silence_duration"] = total_silence_duration;
    jsn["silence_percentage"]     = silence_percentage;
    jsn["num_silent_segments"]    = num_silent_segments;
    jsn["total_duration"]         = total_duration;
    jsn["duration_after_removal"] = duration_after_removal;

    return jsn;
}

SilenceStats
cuecraft::silence::silence_stats(const SilenceIntervals &silence, const double total_duration) {
    SilenceStats result;

    const auto total_silence = std::accumulate(
        silence.begin(), silence.end(), 0.0, [](const double sum, const auto &i) {
            return sum + i.duration();
        });

    result.total_silence_duration = round_to(total_silence);
    result.silence_percentage =
        round_to(total_duration > 0.0 ? total_silence / total_duration * 100.0 : 0.0);
    result.num_silent_segments    = silence.size();
    result.total_duration         = round_to(total_duration);
    result.duration_after_removal = round_to(total_duration - total_silence);

    return result;
}

JsonStore CompactResult::serialise() const {
    JsonStore jsn;

    jsn["keep_intervals"] = serialise_intervals(keep);
    jsn["subtitles"]      = serialise_subtitles(subtitles);
    jsn["dropped"]        = dropped;
    jsn["stats"]          = stats.serialise();

    return jsn;
}

CompactResult cuecraft::silence::compact(
    const SilenceIntervals &silence, const double total_duration, const Subtitles &subtitles) {
    CompactResult result;

    result.keep      = keep_intervals(silence, total_duration);
    result.subtitles = remap_subtitles(silence, subtitles);
    result.dropped   = subtitles.size() - result.subtitles.size();
    result.stats     = silence_stats(silence, total_duration);

    if (result.keep.empty())
        spdlog::warn("No non-silent media left in {:.2f}s", total_duration);

    return result;
}

std::string cuecraft::silence::build_filter_complex(const KeepIntervals &keep) {
    if (keep.empty())
        return "";

    if (keep.size() == 1)
        return fmt::format(
            "[0:v]trim=start={0}:end={1},setpts=PTS-STARTPTS[outv];"
            "[0:a]atrim=start={0}:end={1},asetpts=PTS-STARTPTS[outa]",
            keep[0].start,
            keep[0].end);

    std::vector<std::string> parts;
    std::string video_inputs;
    std::string audio_inputs;

    for (size_t i = 0; i < keep.size(); i++) {
        parts.push_back(fmt::format(
            "[0:v]trim=start={1}:end={2},setpts=PTS-STARTPTS[v{0}];"
            "[0:a]atrim=start={1}:end={2},asetpts=PTS-STARTPTS[a{0}]",
            i,
            keep[i].start,
            keep[i].end));
        video_inputs += fmt::format("[v{}]", i);
        audio_inputs += fmt::format("[a{}]", i);
    }

    parts.push_back(fmt::format(
        "{0}concat=n={2}:v=1:a=0[outv];{1}concat=n={2}:v=0:a=1[outa]",
        video_inputs,
        audio_inputs,
        keep.size()));

    return join_as_string(parts, ";");
}
