// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include "cuecraft/silence/time_interval.hpp"
#include "cuecraft/subtitle/subtitle.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace silence {

    //! Round half away from zero to a number of decimal places.
    double round_to(const double value, const int places = 2);

    /*! Complement of the silence within [0, total_duration).
        Zero length gaps between intervals produce no keep interval.
    */
    KeepIntervals keep_intervals(const SilenceIntervals &silence, const double total_duration);

    //! Total duration of intervals that finished at or before t.
    double removed_before(const SilenceIntervals &silence, const double t);

    //! Position of t on the compacted axis, rounded to 2 places.
    double remap_time(const SilenceIntervals &silence, const double t);

    /*! Shift every subtitle onto the compacted axis.

        Only silence that has fully ended by a timestamp is subtracted from it, so a
        timestamp inside a silence is not pulled back by that silence. Subtitles whose
        remapped timing is invalid are dropped, the rest keep their order, id, text
        and style. With no silence the input is returned untouched.
    */
    subtitle::Subtitles
    remap_subtitles(const SilenceIntervals &silence, const subtitle::Subtitles &subtitles);

    struct SilenceStats {
        double total_silence_duration{0.0};
        double silence_percentage{0.0};
        size_t num_silent_segments{0};
        double total_duration{0.0};
        double duration_after_removal{0.0};

        [[nodiscard]] utility::JsonStore serialise() const;

        template <class Inspector> friend bool inspect(Inspector &f, SilenceStats &x) {
            return f.object(x).fields(
                f.field("tsd", x.total_silence_duration),
                f.field("pct", x.silence_percentage),
                f.field("n", x.num_silent_segments),
                f.field("td", x.total_duration),
                f.field("dar", x.duration_after_removal));
        }
    };

    SilenceStats silence_stats(const SilenceIntervals &silence, const double total_duration);

    struct CompactResult {
        KeepIntervals keep;
        subtitle::Subtitles subtitles;
        size_t dropped{0};
        SilenceStats stats;

        [[nodiscard]] utility::JsonStore serialise() const;

        template <class Inspector> friend bool inspect(Inspector &f, CompactResult &x) {
            return f.object(x).fields(
                f.field("keep", x.keep),
                f.field("subs", x.subtitles),
                f.field("dropped", x.dropped),
                f.field("stats", x.stats));
        }
    };

    //! Keep intervals, remapped subtitles and statistics in one pass.
    CompactResult compact(
        const SilenceIntervals &silence,
        const double total_duration,
        const subtitle::Subtitles &subtitles);

    /*! ffmpeg filter graph cutting the keep intervals out of input 0 and
        concatenating them into [outv] and [outa].
    */
    std::string build_filter_complex(const KeepIntervals &keep);

} // namespace silence
} // namespace cuecraft
