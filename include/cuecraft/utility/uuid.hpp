// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include "stduuid/uuid.h"

namespace cuecraft {
namespace utility {

    //! Random (v4) uuid, the source of every subtitle and session id.
    struct Uuid {
        uuids::uuid uuid_;

        Uuid() = default;
        explicit Uuid(const uuids::uuid &value) : uuid_(value) {}

        //! Unparseable text gives the nil uuid.
        explicit Uuid(const std::string &text) {
            if (auto parsed = uuids::uuid::from_string(text))
                uuid_ = *parsed;
        }

        [[nodiscard]] bool is_null() const { return uuid_.is_nil(); }
        void clear() { uuid_ = uuids::uuid(); }

        void generate_in_place();

        static Uuid generate() {
            Uuid result;
            result.generate_in_place();
            return result;
        }

        //! 32 lower case hex digits.
        [[nodiscard]] std::string hex() const;

        bool operator==(const Uuid &other) const { return uuid_ == other.uuid_; }
        bool operator!=(const Uuid &other) const { return uuid_ != other.uuid_; }
    };

    std::string to_string(const Uuid &uuid);

    /*! Opaque short identifier.
        \param prefix e.g. "sub"
        \param digits number of hex digits taken from a fresh uuid, max 32
        \return "<prefix>_<digits hex>"
    */
    std::string generate_id(const std::string &prefix, const size_t digits = 12);

} // namespace utility
} // namespace cuecraft
