// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <variant>

#include "cuecraft/subtitle/enums.hpp"
#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/subtitle/subtitle.hpp"

namespace cuecraft {
namespace subtitle {

    /*! Per attribute style overlay.
        An empty optional leaves the attribute unchanged.
    */
    struct StyleChange {
        std::optional<std::string> font_family;
        std::optional<int> font_size;
        std::optional<std::string> font_color;
        std::optional<SubtitlePosition> position;
        std::optional<std::string> background_color;
        std::optional<bool> bold;
        std::optional<bool> italic;

        [[nodiscard]] bool empty() const {
            return not(font_family or font_size or font_color or position or
                       background_color or bold or italic);
        }

        [[nodiscard]] Style applied_to(const Style &style) const;
    };

    //! Append a new subtitle, id is assigned by the timeline.
    struct InsertMutation {
        std::string text;
        double start_time{0.0};
        double end_time{0.0};
        Style style;
    };

    //! Overlay fields on the subtitle at a possibly negative index.
    struct UpdateMutation {
        long index{-1};
        std::optional<std::string> text;
        std::optional<double> start_time;
        std::optional<double> end_time;
        StyleChange style;

        [[nodiscard]] bool empty() const {
            return not(text or start_time or end_time) and style.empty();
        }
    };

    struct NoMutation {};

    using Mutation = std::variant<NoMutation, InsertMutation, UpdateMutation>;

    inline MutationKind mutation_kind(const Mutation &mutation) {
        if (std::holds_alternative<InsertMutation>(mutation))
            return MK_INSERT;
        if (std::holds_alternative<UpdateMutation>(mutation))
            return MK_UPDATE;
        return MK_NONE;
    }

    std::string to_string(const MutationKind kind);

    //! Outcome of a committed mutation.
    struct AppliedResult {
        MutationKind kind{MK_NONE};
        size_t index{0};
        Subtitle subtitle{};
    };

} // namespace subtitle
} // namespace cuecraft
