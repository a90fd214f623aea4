// SPDX-License-Identifier: Apache-2.0
#include "cuecraft/utility/helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::utility;

void cuecraft::utility::print_on_exit(const caf::actor &hdl, const std::string &name) {
    hdl->attach_functor([=](const caf::error &reason) {
        spdlog::debug("{} exited: {}", name, to_string(reason));
    });
}

caf::error cuecraft::utility::to_caf_error(const std::exception &err) {
    if (dynamic_cast<const time_parse_error *>(&err))
        return make_error(cuecraft_error::parse_error, err.what());
    if (dynamic_cast<const compile_error *>(&err))
        return make_error(cuecraft_error::compile_error, err.what());
    if (dynamic_cast<const index_out_of_range_error *>(&err))
        return make_error(cuecraft_error::index_out_of_range, err.what());
    if (dynamic_cast<const invalid_timing_error *>(&err))
        return make_error(cuecraft_error::invalid_timing, err.what());
    if (dynamic_cast<const session_missing_error *>(&err))
        return make_error(cuecraft_error::session_missing, err.what());

    return make_error(cuecraft_error::error, err.what());
}
