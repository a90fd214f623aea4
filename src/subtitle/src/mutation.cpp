// SPDX-License-Identifier: Apache-2.0
#include "cuecraft/subtitle/mutation.hpp"

using namespace cuecraft::subtitle;

Style StyleChange::applied_to(const Style &style) const {
    auto result = style;

    if (font_family)
        result.set_font_family(*font_family);
    if (font_size)
        result.set_font_size(*font_size);
    if (font_color)
        result.set_font_color(*font_color);
    if (position)
        result.set_position(*position);
    if (background_color)
        result.set_background_color(background_color);
    if (bold)
        result.set_bold(*bold);
    if (italic)
        result.set_italic(*italic);

    return result;
}

std::string cuecraft::subtitle::to_string(const MutationKind kind) {
    switch (kind) {
    case MK_INSERT:
        return "insert";
    case MK_UPDATE:
        return "update";
    case MK_NONE:
    default:
        return "none";
    }
}
