// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

#include <caf/all.hpp>

#include "cuecraft/atoms.hpp"
#include "cuecraft/error.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/string_helpers.hpp"

namespace cuecraft {
namespace utility {

    template <typename R, typename... Ts>
    R request_receive_wait(
        caf::blocking_actor &src,
        const caf::actor &dest,
        const caf::timespan &wait_for,
        Ts const &...args) {
        R result{};
        src.mail(args...)
            .request(dest, wait_for)
            .receive(
                [&result](const R &res) mutable { result = std::move(res); },
                [=](const caf::error &e) { throw CueCraftError(e); });

        return result;
    }

    template <typename R, typename... Ts>
    R request_receive(caf::blocking_actor &src, const caf::actor &dest, Ts const &...args) {
        R result{};
        src.mail(args...)
            .request(dest, caf::infinite)
            .receive(
                [&result](const R &res) mutable { result = std::move(res); },
                [=](const caf::error &e) { throw CueCraftError(e); });

        return result;
    }

    inline void print_on_create(const caf::actor &hdl, const std::string &name) {
        spdlog::debug("{} created {}", name, to_string(hdl));
    }

    void print_on_exit(const caf::actor &hdl, const std::string &name);

    /*! Map a library exception onto the matching actor error.
        Anything not derived from cuecraft_err becomes cuecraft_error::error.
    */
    caf::error to_caf_error(const std::exception &err);

} // namespace utility
} // namespace cuecraft
