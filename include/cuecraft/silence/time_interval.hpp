// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <vector>

#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace silence {

    //! Half open span of media time in seconds.
    struct TimeInterval {
        TimeInterval() = default;
        TimeInterval(const double _start, const double _end) : start(_start), end(_end) {}
        TimeInterval(const utility::JsonStore &jsn)
            : start(jsn.at("start").get<double>()), end(jsn.at("end").get<double>()) {}

        double start{0.0};
        double end{0.0};

        [[nodiscard]] double duration() const { return end - start; }

        [[nodiscard]] utility::JsonStore serialise() const {
            utility::JsonStore jsn;
            jsn["start"]    = start;
            jsn["end"]      = end;
            jsn["duration"] = duration();
            return jsn;
        }

        template <class Inspector> friend bool inspect(Inspector &f, TimeInterval &x) {
            return f.object(x).fields(f.field("s", x.start), f.field("e", x.end));
        }

        bool operator==(const TimeInterval &other) const {
            return start == other.start and end == other.end;
        }
    };

    //! Detected silence, sorted and disjoint as delivered by the detector.
    using SilenceInterval  = TimeInterval;
    using SilenceIntervals = std::vector<TimeInterval>;

    //! Media kept after compaction.
    using KeepInterval  = TimeInterval;
    using KeepIntervals = std::vector<TimeInterval>;

    inline utility::JsonStore serialise_intervals(const std::vector<TimeInterval> &intervals) {
        auto result = R"([])"_json;
        for (const auto &i : intervals)
            result.emplace_back(i.serialise());
        return result;
    }

    inline std::vector<TimeInterval> intervals_from_json(const utility::JsonStore &jsn) {
        std::vector<TimeInterval> result;
        for (const auto &i : jsn)
            result.emplace_back(utility::JsonStore(i));
        return result;
    }

} // namespace silence
} // namespace cuecraft
