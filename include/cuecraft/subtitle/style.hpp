// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>

#include "cuecraft/subtitle/enums.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace subtitle {

    constexpr int MIN_FONT_SIZE = 12;
    constexpr int MAX_FONT_SIZE = 72;

    std::string to_string(const SubtitlePosition position);

    //! Case insensitive, accepts "centre" and "middle" for SP_CENTER.
    std::optional<SubtitlePosition> position_from_string(const std::string &value);

    inline bool valid_font_size(const int size) {
        return size >= MIN_FONT_SIZE and size <= MAX_FONT_SIZE;
    }

    class Style {
      public:
        Style() = default;
        Style(
            std::string font_family,
            const int font_size,
            std::string font_color,
            const SubtitlePosition position                = SP_BOTTOM,
            const bool bold                                = false,
            const bool italic                              = false,
            std::optional<std::string> background_color = {});
        Style(const utility::JsonStore &jsn);

        [[nodiscard]] const std::string &font_family() const { return font_family_; }
        [[nodiscard]] int font_size() const { return font_size_; }
        [[nodiscard]] const std::string &font_color() const { return font_color_; }
        [[nodiscard]] SubtitlePosition position() const { return position_; }
        [[nodiscard]] const std::optional<std::string> &background_color() const {
            return background_color_;
        }
        [[nodiscard]] bool bold() const { return bold_; }
        [[nodiscard]] bool italic() const { return italic_; }

        [[nodiscard]] bool valid() const { return valid_font_size(font_size_); }

        void set_font_family(const std::string &value) { font_family_ = value; }
        void set_font_size(const int value) { font_size_ = value; }
        void set_font_color(const std::string &value) { font_color_ = value; }
        void set_position(const SubtitlePosition value) { position_ = value; }
        void set_background_color(const std::optional<std::string> &value) {
            background_color_ = value;
        }
        void set_bold(const bool value) { bold_ = value; }
        void set_italic(const bool value) { italic_ = value; }

        [[nodiscard]] utility::JsonStore serialise() const;

        template <class Inspector> friend bool inspect(Inspector &f, Style &x) {
            auto get_position = [&x]() -> int { return static_cast<int>(x.position_); };
            auto set_position = [&x](int value) {
                if (value < SP_TOP or value > SP_BOTTOM)
                    return false;
                x.position_ = static_cast<SubtitlePosition>(value);
                return true;
            };
            return f.object(x).fields(
                f.field("ff", x.font_family_),
                f.field("fs", x.font_size_),
                f.field("fc", x.font_color_),
                f.field("pos", get_position, set_position),
                f.field("bg", x.background_color_),
                f.field("b", x.bold_),
                f.field("i", x.italic_));
        }

        bool operator==(const Style &other) const {
            return font_family_ == other.font_family_ and font_size_ == other.font_size_ and
                   font_color_ == other.font_color_ and position_ == other.position_ and
                   background_color_ == other.background_color_ and bold_ == other.bold_ and
                   italic_ == other.italic_;
        }
        bool operator!=(const Style &other) const { return not(*this == other); }

      private:
        std::string font_family_{"Arial"};
        int font_size_{32};
        std::string font_color_{"white"};
        SubtitlePosition position_{SP_BOTTOM};
        std::optional<std::string> background_color_{};
        bool bold_{false};
        bool italic_{false};
    };

    std::string to_string(const Style &style);

} // namespace subtitle
} // namespace cuecraft
