// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <caf/allowed_unsafe_message_type.hpp>
#include <caf/type_id.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cuecraft/caf_error.hpp"

namespace cuecraft {

const std::string session_registry{"SESSION"};

namespace utility {
    class JsonStore;
} // namespace utility

namespace subtitle {
    class Style;
    class Subtitle;
} // namespace subtitle

namespace silence {
    struct TimeInterval;
    struct SilenceStats;
    struct CompactResult;
} // namespace silence

namespace edit {
    struct EditResult;
} // namespace edit
} // namespace cuecraft

using namespace caf;

#define ACTOR_INIT_GLOBAL_META(...)                                                            \
    caf::init_global_meta_objects<caf::id_block::cuecraft_simple_types>();                     \
    caf::init_global_meta_objects<caf::id_block::cuecraft_complex_types>();                    \
    caf::init_global_meta_objects<caf::id_block::cuecraft_atoms>();

// clang-format off
#define FIRST_CUSTOM_ID (first_custom_type_id + 100)

CAF_BEGIN_TYPE_ID_BLOCK(cuecraft_simple_types, FIRST_CUSTOM_ID)

    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::cuecraft_error))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::edit::EditResult))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::silence::CompactResult))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::silence::TimeInterval))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::silence::SilenceStats))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::subtitle::Style))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::subtitle::Subtitle))
    CAF_ADD_TYPE_ID(cuecraft_simple_types, (cuecraft::utility::JsonStore))

CAF_END_TYPE_ID_BLOCK(cuecraft_simple_types)


CAF_BEGIN_TYPE_ID_BLOCK(cuecraft_complex_types, FIRST_CUSTOM_ID + 100)

    CAF_ADD_TYPE_ID(cuecraft_complex_types, (std::pair<std::string, std::string>))
    CAF_ADD_TYPE_ID(cuecraft_complex_types, (std::vector<std::pair<std::string, std::string>>))
    CAF_ADD_TYPE_ID(cuecraft_complex_types, (std::vector<std::string>))
    CAF_ADD_TYPE_ID(cuecraft_complex_types, (std::vector<cuecraft::silence::TimeInterval>))
    CAF_ADD_TYPE_ID(cuecraft_complex_types, (std::vector<cuecraft::subtitle::Subtitle>))

CAF_END_TYPE_ID_BLOCK(cuecraft_complex_types)


CAF_BEGIN_TYPE_ID_BLOCK(cuecraft_atoms, FIRST_CUSTOM_ID + (100 * 2))

    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::edit, edit_atom)

    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::session, create_session_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::session, get_session_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::session, history_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::session, remove_session_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::session, session_list_atom)

    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::silence, compact_atom)

    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::subtitle, chronological_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::subtitle, clear_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::subtitle, replace_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::subtitle, subtitles_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::subtitle, validate_atom)

    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::utility, name_atom)
    CAF_ADD_ATOM(cuecraft_atoms, cuecraft::utility, serialise_atom)

CAF_END_TYPE_ID_BLOCK(cuecraft_atoms)

CAF_ERROR_CODE_ENUM(cuecraft::cuecraft_error)

// clang-format on

namespace cuecraft {

enum class cuecraft_error_type : uint8_t {
    runtime_error = 1,
    caf_error,
    cuecraft_error,
};

inline std::string to_string(cuecraft_error_type x) {
    switch (x) {
    case cuecraft_error_type::runtime_error:
        return "runtime_error";
    case cuecraft_error_type::caf_error:
        return "caf_error";
    case cuecraft_error_type::cuecraft_error:
        return "cuecraft_error";
    default:
        return "-unknown-error-";
    }
}

//! Carries a caf::error out of a blocking request.
class CueCraftError : public std::runtime_error {
  public:
    CueCraftError()
        : runtime_error("CueCraft error"), error_type_(cuecraft_error_type::cuecraft_error) {}
    CueCraftError(const std::string &msg)
        : runtime_error(msg.c_str()), error_type_(cuecraft_error_type::cuecraft_error) {}
    CueCraftError(const std::runtime_error &err) : runtime_error(err) {}
    CueCraftError(const caf::error &err) : runtime_error(to_string(err)), caf_error_(err) {
        if (err.category() == caf::type_id_v<cuecraft_error>) {
            error_type_ = cuecraft_error_type::cuecraft_error;
        } else {
            error_type_ = cuecraft_error_type::caf_error;
        }
    }

    [[nodiscard]] cuecraft_error_type type() const { return error_type_; }
    [[nodiscard]] caf::error caf_error() const { return caf_error_; }

    //! True when this wraps the given cuecraft error code.
    [[nodiscard]] bool is(const cuecraft_error code) const {
        return error_type_ == cuecraft_error_type::cuecraft_error and
               caf_error_.category() == caf::type_id_v<cuecraft_error> and
               caf_error_.code() == static_cast<uint8_t>(code);
    }

  private:
    cuecraft_error_type error_type_{cuecraft_error_type::runtime_error};
    caf::error caf_error_{};
};
} // namespace cuecraft
