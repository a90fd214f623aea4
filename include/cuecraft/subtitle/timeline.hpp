// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cuecraft/subtitle/mutation.hpp"
#include "cuecraft/subtitle/subtitle.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace subtitle {

    /*! Map an ordinal onto a position in a sequence of length.
        Negative values count from the end, -1 being the last element.
        \return empty when the resolved value falls outside [0, length)
    */
    std::optional<size_t> resolve_index(const long index, const size_t length);

    //! Stable sort by start_time, ties keep insertion order.
    Subtitles chronological(const Subtitles &subtitles);

    /*! Ordered subtitles of one session.

        Insertion order is the canonical order. Every committed subtitle satisfies
        start_time >= 0 and end_time > start_time. All operations either complete
        or leave the contents untouched.
    */
    class Timeline {
      public:
        Timeline() = default;
        //! Invalid subtitles are dropped, as with replace.
        Timeline(const Subtitles &subtitles);
        Timeline(const utility::JsonStore &jsn);

        [[nodiscard]] const Subtitles &subtitles() const { return subtitles_; }
        [[nodiscard]] Subtitles chronological() const {
            return subtitle::chronological(subtitles_);
        }
        [[nodiscard]] size_t size() const { return subtitles_.size(); }
        [[nodiscard]] bool empty() const { return subtitles_.empty(); }

        /*! Commit a mutation.
            Throws index_out_of_range_error or invalid_timing_error, leaving the
            timeline unchanged.
        */
        AppliedResult apply(const Mutation &mutation);

        //! \return number of subtitles kept
        size_t replace(const Subtitles &subtitles);

        void clear() { subtitles_.clear(); }

        //! Human readable timing problems, overlaps are reported, never fixed.
        [[nodiscard]] std::vector<std::string> validate() const;

        [[nodiscard]] utility::JsonStore serialise() const;

        bool operator==(const Timeline &other) const { return subtitles_ == other.subtitles_; }

      private:
        AppliedResult apply_insert(const InsertMutation &mutation);
        AppliedResult apply_update(const UpdateMutation &mutation);

      private:
        Subtitles subtitles_;
    };

} // namespace subtitle
} // namespace cuecraft
