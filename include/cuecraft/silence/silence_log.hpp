// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include "cuecraft/silence/time_interval.hpp"

namespace cuecraft {
namespace silence {

    const std::string DEFAULT_NOISE_THRESHOLD{"-30dB"};
    constexpr double DEFAULT_MIN_SILENCE_DURATION = 1.0;

    /*! Read intervals from ffmpeg silencedetect output.
        The n-th silence_start is paired with the n-th silence_end, a trailing start
        without an end is ignored.
    */
    SilenceIntervals parse_silencedetect_log(const std::string &log);

    //! Audio filter argument for the external detector run.
    std::string silencedetect_filter(
        const std::string &noise_threshold = DEFAULT_NOISE_THRESHOLD,
        const double min_silence_duration  = DEFAULT_MIN_SILENCE_DURATION);

} // namespace silence
} // namespace cuecraft
