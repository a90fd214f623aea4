// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cuecraft/subtitle/subtitle.hpp"

namespace cuecraft {
namespace session {

    //! "sess_" followed by 16 hex digits.
    std::string generate_session_id();

    /*! Keyed storage of session timelines.
        Expiry is the concern of the implementation, not of its callers.
    */
    class SessionStore {
      public:
        virtual ~SessionStore() = default;

        [[nodiscard]] virtual std::optional<subtitle::Subtitles>
        get(const std::string &session_id) const = 0;

        virtual void put(const std::string &session_id, const subtitle::Subtitles &timeline) = 0;

        //! \return false when there was nothing to remove
        virtual bool erase(const std::string &session_id) = 0;

        [[nodiscard]] virtual bool contains(const std::string &session_id) const {
            return get(session_id).has_value();
        }

        [[nodiscard]] virtual std::vector<std::string> keys() const = 0;
    };

    class MemorySessionStore : public SessionStore {
      public:
        MemorySessionStore()           = default;
        ~MemorySessionStore() override = default;

        [[nodiscard]] std::optional<subtitle::Subtitles>
        get(const std::string &session_id) const override;
        void put(const std::string &session_id, const subtitle::Subtitles &timeline) override;
        bool erase(const std::string &session_id) override;
        [[nodiscard]] bool contains(const std::string &session_id) const override;
        [[nodiscard]] std::vector<std::string> keys() const override;

      private:
        mutable std::mutex mutex_;
        std::map<std::string, subtitle::Subtitles> sessions_;
    };

    /*! One <session_id>.json document per session in a directory.
        Session ids are restricted to letters, digits, '-' and '_'.
    */
    class FileSessionStore : public SessionStore {
      public:
        FileSessionStore(std::filesystem::path directory);
        ~FileSessionStore() override = default;

        [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }

        [[nodiscard]] std::optional<subtitle::Subtitles>
        get(const std::string &session_id) const override;
        void put(const std::string &session_id, const subtitle::Subtitles &timeline) override;
        bool erase(const std::string &session_id) override;
        [[nodiscard]] bool contains(const std::string &session_id) const override;
        [[nodiscard]] std::vector<std::string> keys() const override;

      private:
        [[nodiscard]] std::filesystem::path session_path(const std::string &session_id) const;

        std::filesystem::path directory_;
        mutable std::mutex mutex_;
    };

} // namespace session
} // namespace cuecraft
