// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "cuecraft/utility/logging.hpp"

// gtest prints json through this instead of dumping bytes
namespace nlohmann {
inline void PrintTo(json const &json, std::ostream *os) { *os << json.dump(); }
} // namespace nlohmann

namespace cuecraft {
namespace utility {

    namespace fs = std::filesystem;

    /*! nlohmann::json addressed by JSON pointer strings.

        Preferences, session files and every serialise() result travel as a
        JsonStore.
    */
    class JsonStore : public nlohmann::json {
      public:
        JsonStore(nlohmann::json json = nlohmann::json());
        virtual ~JsonStore() = default;

        //! Throws nlohmann::json::out_of_range when the path is missing.
        [[nodiscard]] nlohmann::json get(const std::string &path) const;

        template <typename result_type>
        [[nodiscard]] result_type get(const std::string &path = "") const {
            return get(path);
        }

        template <typename result_type>
        [[nodiscard]] result_type
        get_or(const std::string &path, const result_type &default_val) const {
            if (is_null())
                return default_val;
            return value(nlohmann::json::json_pointer(path), default_val);
        }

        void set(const nlohmann::json &json, const std::string &path = "");

        //! \return false when nothing was at path
        bool remove(const std::string &path);

        /*! Overlay json onto the value at path, leaf by leaf.
            Keys absent from json keep their current value.
        */
        void merge(const nlohmann::json &json, const std::string &path = "");

        [[nodiscard]] std::string dump(int pad = 0) const {
            return nlohmann::json::dump(
                pad, ' ', false, nlohmann::detail::error_handler_t::replace);
        }
    };

    template <class Inspector> bool inspect(Inspector &f, JsonStore &x) {
        auto get_jsn = [&x] { return x.dump(-1); };
        auto set_jsn = [&x](const std::string &val) {
            try {
                x.set(nlohmann::json::parse(val));
            } catch (const std::exception &err) {
                spdlog::warn("{} {}", __PRETTY_FUNCTION__, err.what());
                return false;
            }
            return true;
        };
        return f.object(x).fields(f.field("jsn", get_jsn, set_jsn));
    }

    void to_json(nlohmann::json &j, const JsonStore &c);
    void from_json(const nlohmann::json &j, JsonStore &c);

    std::string to_string(const JsonStore &json);

    //! Throws cuecraft_err on a missing file, nlohmann::json::parse_error on bad syntax.
    JsonStore read_json_file(const fs::path &path);

    //! Write atomically via a temporary sibling file.
    void write_json_file(const fs::path &path, const JsonStore &json, const int pad = 2);

    /*! Merge every *.json directly under path into merged, in directory order.
        A missing directory or unreadable file is logged and skipped.
    */
    JsonStore merge_json_from_path(const fs::path &path, JsonStore merged = JsonStore());

} // namespace utility
} // namespace cuecraft
