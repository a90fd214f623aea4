// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include "cuecraft/edit/edit_compiler.hpp"
#include "cuecraft/edit/edit_params.hpp"
#include "cuecraft/subtitle/mutation.hpp"
#include "cuecraft/subtitle/subtitle.hpp"
#include "cuecraft/subtitle/timeline.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace edit {

    //! Raw oracle answer, intent label and parameter text.
    struct OracleReply {
        std::string intent;
        std::string params;
    };

    /*! Natural language understanding collaborator.
        Implementations wrap whatever model service turns a user message into an
        intent and a parameter object.
    */
    class IntentOracle {
      public:
        virtual ~IntentOracle() = default;

        /*! \param message user text
            \param context description of the current timeline, see timeline_context
        */
        virtual OracleReply interpret(const std::string &message, const std::string &context) = 0;
    };

    struct EditResult {
        std::string intent;
        subtitle::MutationKind kind{subtitle::MK_NONE};
        size_t index{0};
        subtitle::Subtitle subtitle{};
        size_t count{0};
        std::string reply;

        [[nodiscard]] bool changed() const { return kind != subtitle::MK_NONE; }

        [[nodiscard]] utility::JsonStore serialise() const;

        template <class Inspector> friend bool inspect(Inspector &f, EditResult &x) {
            auto get_kind = [&x]() -> int { return static_cast<int>(x.kind); };
            auto set_kind = [&x](int value) {
                if (value < subtitle::MK_NONE or value > subtitle::MK_UPDATE)
                    return false;
                x.kind = static_cast<subtitle::MutationKind>(value);
                return true;
            };
            return f.object(x).fields(
                f.field("intent", x.intent),
                f.field("kind", get_kind, set_kind),
                f.field("idx", x.index),
                f.field("sub", x.subtitle),
                f.field("count", x.count),
                f.field("reply", x.reply));
        }
    };

    //! Reply text for the user.
    std::string describe(const EditResult &result, const EditParams &params);

    //! Summary of the current subtitles handed to the oracle.
    std::string timeline_context(const subtitle::Subtitles &subtitles);

    /*! oracle reply -> params -> mutation -> applied result.
        Each stage either hands a value to the next or throws, in which case the
        timeline is left as it was.
    */
    class EditPipeline {
      public:
        EditPipeline(EditCompiler compiler = EditCompiler()) : compiler_(std::move(compiler)) {}

        [[nodiscard]] const EditCompiler &compiler() const { return compiler_; }

        EditResult run(const OracleReply &reply, subtitle::Timeline &timeline) const;

        EditResult
        run(const std::string &intent, const EditParams &params, subtitle::Timeline &timeline)
            const;

        EditResult
        run(IntentOracle &oracle, const std::string &message, subtitle::Timeline &timeline) const;

      private:
        EditCompiler compiler_;
    };

} // namespace edit
} // namespace cuecraft
