// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <vector>

#include "cuecraft/subtitle/style.hpp"
#include "cuecraft/utility/json_store.hpp"

namespace cuecraft {
namespace subtitle {

    class Subtitle;
    using Subtitles = std::vector<Subtitle>;

    class Subtitle {
      public:
        Subtitle() = default;
        Subtitle(
            std::string id,
            std::string text,
            const double start_time,
            const double end_time,
            Style style = Style());
        Subtitle(const utility::JsonStore &jsn);

        [[nodiscard]] const std::string &id() const { return id_; }
        [[nodiscard]] const std::string &text() const { return text_; }
        [[nodiscard]] double start_time() const { return start_time_; }
        [[nodiscard]] double end_time() const { return end_time_; }
        [[nodiscard]] double duration() const { return end_time_ - start_time_; }
        [[nodiscard]] const Style &style() const { return style_; }

        //! start_time >= 0 and end_time > start_time
        [[nodiscard]] bool valid_timing() const {
            return start_time_ >= 0.0 and end_time_ > start_time_;
        }
        [[nodiscard]] bool valid() const { return valid_timing() and style_.valid(); }

        void set_id(const std::string &value) { id_ = value; }
        void set_text(const std::string &value) { text_ = value; }
        void set_start_time(const double value) { start_time_ = value; }
        void set_end_time(const double value) { end_time_ = value; }
        void set_style(const Style &value) { style_ = value; }

        [[nodiscard]] utility::JsonStore serialise() const;

        template <class Inspector> friend bool inspect(Inspector &f, Subtitle &x) {
            return f.object(x).fields(
                f.field("id", x.id_),
                f.field("txt", x.text_),
                f.field("st", x.start_time_),
                f.field("et", x.end_time_),
                f.field("sty", x.style_));
        }

        bool operator==(const Subtitle &other) const {
            return id_ == other.id_ and text_ == other.text_ and
                   start_time_ == other.start_time_ and end_time_ == other.end_time_ and
                   style_ == other.style_;
        }

      private:
        std::string id_{};
        std::string text_{};
        double start_time_{0.0};
        double end_time_{0.0};
        Style style_{};
    };

    inline utility::JsonStore serialise_subtitles(const Subtitles &subtitles) {
        auto result = R"([])"_json;
        for (const auto &i : subtitles)
            result.emplace_back(i.serialise());

        return result;
    }

    //! Throws on malformed entries, performs no validity filtering.
    Subtitles subtitles_from_json(const utility::JsonStore &jsn);

} // namespace subtitle
} // namespace cuecraft
