// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace cuecraft {

class cuecraft_err : public std::runtime_error {
  public:
    cuecraft_err(const std::string &what_arg) : std::runtime_error(what_arg) {}
    cuecraft_err(const char *what_arg) : std::runtime_error(what_arg) {}
};

//! Time reference text matched none of the accepted forms.
class time_parse_error : public cuecraft_err {
  public:
    using cuecraft_err::cuecraft_err;
};

//! Intent and parameters cannot be turned into a mutation.
class compile_error : public cuecraft_err {
  public:
    using cuecraft_err::cuecraft_err;
};

class index_out_of_range_error : public cuecraft_err {
  public:
    using cuecraft_err::cuecraft_err;
};

//! Resulting subtitle would break start >= 0 and end > start.
class invalid_timing_error : public cuecraft_err {
  public:
    using cuecraft_err::cuecraft_err;
};

class session_missing_error : public cuecraft_err {
  public:
    using cuecraft_err::cuecraft_err;
};

} // namespace cuecraft
