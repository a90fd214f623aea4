// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

namespace cuecraft {
namespace edit {

    /*! Convert a free form time reference into seconds.

      Accepted forms, tried in order on the lower cased, trimmed text:
        - "MM:SS" or "HH:MM:SS", groups may be decimal, result may be 0
        - any combination of "<int> hour|hr|h", "<int> minute|min|m" and
          "<decimal> second|sec|s"
        - a bare number

      The last two forms must give a value > 0.

      \param text  time reference
      \return seconds
      \throws time_parse_error when nothing matches
    */
    double parse_time_reference(const std::string &text);

    //! As parse_time_reference, empty on failure.
    std::optional<double> try_parse_time_reference(const std::string &text);

} // namespace edit
} // namespace cuecraft
