// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "caf/all.hpp"

namespace cuecraft {
enum class cuecraft_error : uint8_t {
    error = 1,
    parse_error,
    compile_error,
    index_out_of_range,
    invalid_timing,
    session_missing
};

inline std::string to_string(cuecraft_error x) {
    switch (x) {
    case cuecraft_error::error:
        return "error";
    case cuecraft_error::parse_error:
        return "parse_error";
    case cuecraft_error::compile_error:
        return "compile_error";
    case cuecraft_error::index_out_of_range:
        return "index_out_of_range";
    case cuecraft_error::invalid_timing:
        return "invalid_timing";
    case cuecraft_error::session_missing:
        return "session_missing";
    default:
        return "-unknown-error-";
    }
}

inline bool from_string(std::string_view in, cuecraft_error &out) {
    if (in == "error") {
        out = cuecraft_error::error;
        return true;
    } else if (in == "parse_error") {
        out = cuecraft_error::parse_error;
        return true;
    } else if (in == "compile_error") {
        out = cuecraft_error::compile_error;
        return true;
    } else if (in == "index_out_of_range") {
        out = cuecraft_error::index_out_of_range;
        return true;
    } else if (in == "invalid_timing") {
        out = cuecraft_error::invalid_timing;
        return true;
    } else if (in == "session_missing") {
        out = cuecraft_error::session_missing;
        return true;
    } else {
        return false;
    }
}

inline bool from_integer(uint8_t in, cuecraft_error &out) {
    if (in >= 1 and in <= 6) {
        out = static_cast<cuecraft_error>(in);
        return true;
    }
    return false;
}

template <class Inspector> bool inspect(Inspector &f, cuecraft_error &x) {
    return caf::default_enum_inspect(f, x);
}
} // namespace cuecraft
