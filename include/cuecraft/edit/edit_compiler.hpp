// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include "cuecraft/edit/edit_params.hpp"
#include "cuecraft/subtitle/mutation.hpp"
#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/subtitle/timeline.hpp"

namespace cuecraft {
namespace edit {

    const std::string INTENT_ADD_SUBTITLE{"add_subtitle"};
    const std::string INTENT_MODIFY_SUBTITLE{"modify_subtitle"};
    const std::string INTENT_MODIFY_STYLE{"modify_style"};
    const std::string INTENT_REMOVE_SUBTITLE{"remove_subtitle"};
    const std::string INTENT_LIST_SUBTITLES{"list_subtitles"};
    const std::string INTENT_CLEAR_ALL{"clear_all"};
    const std::string INTENT_HELP{"help"};

    constexpr double DEFAULT_SUBTITLE_DURATION = 3.0;

    //! Lower case and trim raw oracle intent text.
    std::string normalise_intent(const std::string &raw);

    /*! Turns an intent and its parameters into at most one mutation.

        Only add_subtitle, modify_subtitle and modify_style produce a mutation, any
        other intent compiles to NoMutation. Index bounds are left to the timeline.
    */
    class EditCompiler {
      public:
        EditCompiler(
            subtitle::Style default_style = subtitle::Style(),
            const double default_duration = DEFAULT_SUBTITLE_DURATION);

        [[nodiscard]] const subtitle::Style &default_style() const { return default_style_; }
        [[nodiscard]] double default_duration() const { return default_duration_; }

        /*! \throws compile_error on unusable parameter values
         */
        [[nodiscard]] subtitle::Mutation compile(
            const std::string &intent,
            const EditParams &params,
            const subtitle::Timeline &timeline) const;

        [[nodiscard]] subtitle::Mutation compile(
            const std::string &intent,
            const std::string &raw_params,
            const subtitle::Timeline &timeline) const;

      private:
        [[nodiscard]] subtitle::InsertMutation compile_insert(const EditParams &params) const;
        [[nodiscard]] subtitle::UpdateMutation compile_update(const EditParams &params) const;

        subtitle::Style default_style_;
        double default_duration_;
    };

} // namespace edit
} // namespace cuecraft
