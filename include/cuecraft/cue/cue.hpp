// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/subtitle/subtitle.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace cue {

    //! One timed entry of an exported subtitle file, index is 1 based.
    struct Cue {
        size_t index{1};
        double start{0.0};
        double end{0.0};
        std::string text;
        subtitle::Style style;

        [[nodiscard]] utility::JsonStore serialise() const;
    };

    using Cues = std::vector<Cue>;

    //! Chronological cues, numbered from 1.
    Cues make_cues(const subtitle::Subtitles &subtitles);

    utility::JsonStore serialise_cues(const Cues &cues);

    //! HH:MM:SS,mmm
    std::string format_srt_time(const double seconds);

    //! H:MM:SS.cc
    std::string format_ass_time(const double seconds);

    //! Named colours map to hex, unknown names give #FFFFFF, hex is upper cased.
    std::string colour_to_hex(const std::string &colour);

    //! {r, g, b} from "#RRGGBB" or "RRGGBB".
    std::optional<std::vector<int>> hex_to_rgb(const std::string &hex);

    //! &H00BBGGRR, white when the colour cannot be read.
    std::string ass_colour(const std::string &colour);

    //! Numpad alignment, 2 bottom, 5 center, 8 top.
    int ass_alignment(const subtitle::SubtitlePosition position);

    //! e.g. "Arial_32_white"
    std::string ass_style_name(const subtitle::Style &style);

    //! Wraps text in <b> and <i> tags following the style.
    std::string srt_styled_text(const std::string &text, const subtitle::Style &style);

} // namespace cue
} // namespace cuecraft
