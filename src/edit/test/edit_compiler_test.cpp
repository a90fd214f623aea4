// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "cuecraft/edit/edit_compiler.hpp"
#include "cuecraft/error.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;
using namespace nlohmann;

namespace {
Mutation compile(const std::string &intent, const std::string &params) {
    return EditCompiler().compile(intent, params, Timeline());
}
} // namespace

TEST(EditCompilerTest, Intent) {
    EXPECT_EQ(normalise_intent("  Add_Subtitle\n"), INTENT_ADD_SUBTITLE);

    EXPECT_EQ(mutation_kind(compile("help", "{}")), MK_NONE);
    EXPECT_EQ(mutation_kind(compile("list_subtitles", "{}")), MK_NONE);
    EXPECT_EQ(mutation_kind(compile("remove_subtitle", R"({"subtitle_index": 0})")), MK_NONE);
    EXPECT_EQ(mutation_kind(compile("clear_all", "{}")), MK_NONE);
    EXPECT_EQ(mutation_kind(compile("unknown", R"({"text": "x"})")), MK_NONE);
    EXPECT_EQ(mutation_kind(compile("Add_Subtitle", R"({"text": "x"})")), MK_NONE)
        << "Intent match is exact";
}

TEST(EditCompilerTest, Insert) {
    auto m = compile(
        INTENT_ADD_SUBTITLE,
        R"({"text": "Hello", "start_time": "1:30", "end_time": "1:35", "font_color": "red"})");
    ASSERT_EQ(mutation_kind(m), MK_INSERT);

    const auto &insert = std::get<InsertMutation>(m);
    EXPECT_EQ(insert.text, "Hello");
    EXPECT_DOUBLE_EQ(insert.start_time, 90.0);
    EXPECT_DOUBLE_EQ(insert.end_time, 95.0);
    EXPECT_EQ(insert.style.font_color(), "red");
    EXPECT_EQ(insert.style.font_family(), "Arial");
    EXPECT_EQ(insert.style.font_size(), 32);
}

TEST(EditCompilerTest, InsertDefaults) {
    auto empty = std::get<InsertMutation>(compile(INTENT_ADD_SUBTITLE, "{}"));
    EXPECT_EQ(empty.text, "");
    EXPECT_DOUBLE_EQ(empty.start_time, 0.0);
    EXPECT_DOUBLE_EQ(empty.end_time, 3.0);
    EXPECT_EQ(empty.style, Style());

    auto no_end = std::get<InsertMutation>(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "10 seconds"})"));
    EXPECT_DOUBLE_EQ(no_end.start_time, 10.0);
    EXPECT_DOUBLE_EQ(no_end.end_time, 13.0);

    auto bad_end = std::get<InsertMutation>(compile(
        INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "10", "end_time": "soon"})"));
    EXPECT_DOUBLE_EQ(bad_end.end_time, 13.0);

    auto early_end = std::get<InsertMutation>(compile(
        INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "10", "end_time": "5"})"));
    EXPECT_DOUBLE_EQ(early_end.end_time, 13.0);

    auto bad_start = std::get<InsertMutation>(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "whenever"})"));
    EXPECT_DOUBLE_EQ(bad_start.start_time, 0.0);
    EXPECT_DOUBLE_EQ(bad_start.end_time, 3.0);

    auto negative = std::get<InsertMutation>(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "-1:00"})"));
    EXPECT_DOUBLE_EQ(negative.start_time, 0.0);
    EXPECT_DOUBLE_EQ(negative.end_time, 3.0);

    auto negative_end = std::get<InsertMutation>(compile(
        INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "5", "end_time": "-1:30"})"));
    EXPECT_DOUBLE_EQ(negative_end.start_time, 5.0);
    EXPECT_DOUBLE_EQ(negative_end.end_time, 8.0);

    auto overflow = std::get<InsertMutation>(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "1e308:0"})"));
    EXPECT_DOUBLE_EQ(overflow.start_time, 0.0);
    EXPECT_DOUBLE_EQ(overflow.end_time, 3.0);

    auto overflow_end = std::get<InsertMutation>(compile(
        INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "2", "end_time": "1e308:0"})"));
    EXPECT_DOUBLE_EQ(overflow_end.start_time, 2.0);
    EXPECT_DOUBLE_EQ(overflow_end.end_time, 5.0);

    auto huge = std::get<InsertMutation>(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "start_time": "1e20"})"));
    EXPECT_GT(huge.end_time, huge.start_time);

    auto garbage = std::get<InsertMutation>(compile(INTENT_ADD_SUBTITLE, "not json at all"));
    EXPECT_EQ(garbage.text, "");
    EXPECT_DOUBLE_EQ(garbage.start_time, 0.0);
    EXPECT_DOUBLE_EQ(garbage.end_time, 3.0);
}

TEST(EditCompilerTest, ConfiguredDefaults) {
    EditCompiler compiler(Style("Roboto", 24, "yellow", SP_TOP), 5.0);

    auto insert = std::get<InsertMutation>(
        compiler.compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "font_size": 60})", Timeline()));

    EXPECT_DOUBLE_EQ(insert.end_time, 5.0);
    EXPECT_EQ(insert.style.font_family(), "Roboto");
    EXPECT_EQ(insert.style.font_size(), 60);
    EXPECT_EQ(insert.style.font_color(), "yellow");
    EXPECT_EQ(insert.style.position(), SP_TOP);
}

TEST(EditCompilerTest, ModifyStyle) {
    auto insert = compile(INTENT_MODIFY_STYLE, R"({"text": "x", "font_color": "red"})");
    EXPECT_EQ(mutation_kind(insert), MK_INSERT) << "No ordinal adds a styled subtitle";

    auto null_index =
        compile(INTENT_MODIFY_STYLE, R"({"font_color": "red", "subtitle_index": null})");
    EXPECT_EQ(mutation_kind(null_index), MK_INSERT);

    auto update = compile(INTENT_MODIFY_STYLE, R"({"font_color": "red", "subtitle_index": 1})");
    ASSERT_EQ(mutation_kind(update), MK_UPDATE);
    EXPECT_EQ(std::get<UpdateMutation>(update).index, 1);
    EXPECT_EQ(std::get<UpdateMutation>(update).style.font_color, "red");
}

TEST(EditCompilerTest, Update) {
    auto m = compile(INTENT_MODIFY_SUBTITLE, R"({"text": "New", "bold": true})");
    ASSERT_EQ(mutation_kind(m), MK_UPDATE);

    const auto &update = std::get<UpdateMutation>(m);
    EXPECT_EQ(update.index, -1) << "Defaults to the last subtitle";
    EXPECT_EQ(update.text, "New");
    EXPECT_FALSE(update.start_time) << "Absent times never default";
    EXPECT_FALSE(update.end_time);
    EXPECT_EQ(update.style.bold, true);
    EXPECT_FALSE(update.style.font_color);

    auto timed = std::get<UpdateMutation>(compile(
        INTENT_MODIFY_SUBTITLE,
        R"({"subtitle_index": "first", "start_time": "2 seconds", "end_time": null})"));
    EXPECT_EQ(timed.index, 0);
    EXPECT_EQ(timed.start_time, 2.0);
    EXPECT_FALSE(timed.end_time);
    EXPECT_FALSE(timed.text);

    auto out_of_range =
        std::get<UpdateMutation>(compile(INTENT_MODIFY_SUBTITLE, R"({"subtitle_index": 42})"));
    EXPECT_EQ(out_of_range.index, 42) << "Bounds are checked by the timeline";
}

TEST(EditCompilerTest, Errors) {
    EXPECT_THROW(
        compile(INTENT_ADD_SUBTITLE, R"({"text": "x", "font_size": 100})"), compile_error);
    EXPECT_THROW(
        compile(INTENT_MODIFY_SUBTITLE, R"({"font_size": 8})"), compile_error);
    EXPECT_THROW(
        compile(INTENT_MODIFY_SUBTITLE, R"({"start_time": "whenever"})"), compile_error);
    EXPECT_THROW(
        compile(INTENT_ADD_SUBTITLE, R"({"position": "left"})"), compile_error);

    EXPECT_NO_THROW(compile(INTENT_ADD_SUBTITLE, R"({"font_size": 12})"));
    EXPECT_NO_THROW(compile(INTENT_ADD_SUBTITLE, R"({"font_size": 72})"));
}
