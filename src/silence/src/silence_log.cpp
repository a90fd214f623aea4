// SPDX-License-Identifier: Apache-2.0
#include <regex>

#include <fmt/format.h>

#include "cuecraft/silence/silence_log.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::silence;
using namespace cuecraft::utility;

namespace {
std::vector<double> capture_all(const std::string &log, const std::regex &re) {
    std::vector<double> result;

    for (auto it = std::sregex_iterator(log.begin(), log.end(), re);
         it != std::sregex_iterator();
         ++it) {
        if (auto value = to_double((*it)[1].str()))
            result.push_back(*value);
        else
            spdlog::warn("Unreadable silencedetect value {}", (*it)[1].str());
    }

    return result;
}
} // namespace

SilenceIntervals cuecraft::silence::parse_silencedetect_log(const std::string &log) {
    static const std::regex start_re(R"(silence_start: ([\d.]+))");
    static const std::regex end_re(R"(silence_end: ([\d.]+) \| silence_duration: [\d.]+)");

    const auto starts = capture_all(log, start_re);
    const auto ends   = capture_all(log, end_re);

    SilenceIntervals result;
    for (size_t i = 0; i < ends.size() and i < starts.size(); i++)
        result.emplace_back(starts[i], ends[i]);

    spdlog::debug("Found {} silent intervals", result.size());

    return result;
}

std::string cuecraft::silence::silencedetect_filter(
    const std::string &noise_threshold, const double min_silence_duration) {
    return fmt::format("silencedetect=noise={}:d={}", noise_threshold, min_silence_duration);
}
