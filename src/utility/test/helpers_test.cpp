// SPDX-License-Identifier: Apache-2.0
#include <caf/all.hpp>
#include <gtest/gtest.h>

#include "cuecraft/atoms.hpp"
#include "cuecraft/utility/serialise_headers.hpp"

#include "cuecraft/error.hpp"
#include "cuecraft/utility/helpers.hpp"

using namespace caf;
using namespace cuecraft;
using namespace cuecraft::utility;

ACTOR_TEST_SETUP()

TEST(HelpersTest, ToCafError) {
    auto parse = to_caf_error(time_parse_error("bad time"));
    EXPECT_EQ(parse.category(), caf::type_id_v<cuecraft_error>);
    EXPECT_EQ(parse.code(), static_cast<uint8_t>(cuecraft_error::parse_error));

    EXPECT_EQ(
        to_caf_error(compile_error("x")).code(),
        static_cast<uint8_t>(cuecraft_error::compile_error));
    EXPECT_EQ(
        to_caf_error(index_out_of_range_error("x")).code(),
        static_cast<uint8_t>(cuecraft_error::index_out_of_range));
    EXPECT_EQ(
        to_caf_error(invalid_timing_error("x")).code(),
        static_cast<uint8_t>(cuecraft_error::invalid_timing));
    EXPECT_EQ(
        to_caf_error(session_missing_error("x")).code(),
        static_cast<uint8_t>(cuecraft_error::session_missing));
    EXPECT_EQ(
        to_caf_error(std::runtime_error("x")).code(),
        static_cast<uint8_t>(cuecraft_error::error));
}

TEST(HelpersTest, RequestReceive) {
    fixture f;

    auto echo = f.system.spawn([]() -> caf::behavior {
        return {
            [](utility::name_atom) -> std::string { return "echo"; },
            [](utility::name_atom, const std::string &value) -> caf::result<std::string> {
                if (value.empty())
                    return to_caf_error(index_out_of_range_error("empty"));
                return value;
            }};
    });

    EXPECT_EQ(request_receive<std::string>(*(f.self), echo, name_atom_v), "echo");
    EXPECT_EQ(
        request_receive<std::string>(*(f.self), echo, name_atom_v, std::string("abc")), "abc");

    try {
        request_receive<std::string>(*(f.self), echo, name_atom_v, std::string());
        FAIL() << "Should throw";
    } catch (const CueCraftError &err) {
        EXPECT_EQ(err.type(), cuecraft_error_type::cuecraft_error);
        EXPECT_TRUE(err.is(cuecraft_error::index_out_of_range));
        EXPECT_FALSE(err.is(cuecraft_error::parse_error));
    }

    EXPECT_EQ(
        request_receive_wait<std::string>(
            *(f.self), echo, std::chrono::seconds(1), name_atom_v),
        "echo");

    f.self->send_exit(echo, caf::exit_reason::user_shutdown);
}
