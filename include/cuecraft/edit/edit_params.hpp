// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

#include "cuecraft/subtitle/enums.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace edit {

    typedef enum { PS_ABSENT = 0, PS_NULL, PS_PRESENT } ParamState;

    //! One oracle supplied value, distinguishing absent, explicit null and a value.
    template <typename T> class Param {
      public:
        Param() = default;
        Param(T value) : state_(PS_PRESENT), value_(std::move(value)) {}

        static Param null() {
            Param result;
            result.state_ = PS_NULL;
            return result;
        }

        [[nodiscard]] ParamState state() const { return state_; }
        [[nodiscard]] bool absent() const { return state_ == PS_ABSENT; }
        [[nodiscard]] bool is_null() const { return state_ == PS_NULL; }
        [[nodiscard]] bool present() const { return state_ == PS_PRESENT; }

        //! Value when present, else empty.
        [[nodiscard]] const std::optional<T> &get() const { return value_; }

        [[nodiscard]] T value_or(const T &fallback) const {
            return present() ? *value_ : fallback;
        }

      private:
        ParamState state_{PS_ABSENT};
        std::optional<T> value_{};
    };

    /*! Parameters extracted by the oracle for a single edit.

        Time fields keep their raw text, they are interpreted by the compiler.
        Empty strings count as null.
    */
    struct EditParams {
        Param<std::string> text;
        Param<std::string> start_time;
        Param<std::string> end_time;
        Param<std::string> font_family;
        Param<int> font_size;
        Param<std::string> font_color;
        Param<subtitle::SubtitlePosition> position;
        Param<std::string> background_color;
        Param<bool> bold;
        Param<bool> italic;
        Param<long> subtitle_index;

        /*! Typed view of a parameter object.
            \throws compile_error when a field has an unusable type or value
        */
        static EditParams from_json(const utility::JsonStore &jsn);

        /*! Parse raw oracle output.
            Falls back to the first brace delimited object inside the text, then to
            an empty parameter set.
        */
        static EditParams from_text(const std::string &raw);

        //! Only present fields, in their normalised form.
        [[nodiscard]] utility::JsonStore serialise() const;
    };

    /*! Ordinal text to index.
        Accepts integers, "first" .. "tenth", "last" and "second to last".
        Word forms are one based, integers are taken as is.
    */
    std::optional<long> parse_ordinal(const std::string &text);

} // namespace edit
} // namespace cuecraft
