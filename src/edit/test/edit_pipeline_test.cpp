// SPDX-License-Identifier: Apache-2.0
#include <gtest/gtest.h>

#include "cuecraft/edit/edit_pipeline.hpp"
#include "cuecraft/error.hpp"

using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

namespace {
class ScriptedOracle : public IntentOracle {
  public:
    ScriptedOracle(OracleReply reply) : reply_(std::move(reply)) {}

    OracleReply interpret(const std::string &message, const std::string &context) override {
        last_message_ = message;
        last_context_ = context;
        return reply_;
    }

    OracleReply reply_;
    std::string last_message_;
    std::string last_context_;
};
} // namespace

TEST(EditPipelineTest, Add) {
    EditPipeline pipeline;
    Timeline t;

    auto r = pipeline.run(
        OracleReply{
            "add_subtitle",
            R"({"text": "Hello World", "start_time": "0", "end_time": "5 seconds",
                "font_color": "red", "font_size": 48})"},
        t);

    EXPECT_TRUE(r.changed());
    EXPECT_EQ(r.kind, MK_INSERT);
    EXPECT_EQ(r.index, size_t(0));
    EXPECT_EQ(r.count, size_t(1));
    EXPECT_EQ(t.size(), size_t(1));
    EXPECT_EQ(
        r.reply,
        "Added subtitle: \"Hello World\" from 0.0s to 5.0s with color: red, size: 48px");

    auto jsn = r.serialise();
    EXPECT_EQ(jsn.at("mutation"), "insert");
    EXPECT_EQ(jsn.at("index"), 0);
    EXPECT_EQ(jsn.at("subtitle").at("text"), "Hello World");
}

TEST(EditPipelineTest, Update) {
    EditPipeline pipeline;
    Timeline t;
    pipeline.run(OracleReply{"add_subtitle", R"({"text": "One"})"}, t);
    pipeline.run(OracleReply{"add_subtitle", R"({"text": "Two", "start_time": "3"})"}, t);

    auto r = pipeline.run(
        OracleReply{" MODIFY_SUBTITLE ", R"({"subtitle_index": "first", "text": "Uno"})"}, t);

    EXPECT_EQ(r.kind, MK_UPDATE);
    EXPECT_EQ(r.intent, INTENT_MODIFY_SUBTITLE);
    EXPECT_EQ(r.index, size_t(0));
    EXPECT_EQ(t.subtitles()[0].text(), "Uno");
    EXPECT_EQ(r.reply, "Updated subtitle 1: \"Uno\" from 0.0s to 3.0s");
}

TEST(EditPipelineTest, NoChange) {
    EditPipeline pipeline;
    Timeline t;
    pipeline.run(OracleReply{"add_subtitle", R"({"text": "One"})"}, t);

    auto help = pipeline.run(OracleReply{"help", "{}"}, t);
    EXPECT_FALSE(help.changed());
    EXPECT_NE(help.reply.find("I can help you add and style subtitles!"), std::string::npos);
    EXPECT_TRUE(help.serialise().at("index").is_null());
    EXPECT_TRUE(help.serialise().at("subtitle").is_null());

    auto list = pipeline.run(OracleReply{"list_subtitles", "{}"}, t);
    EXPECT_EQ(list.reply, "There are 1 subtitles.");

    auto other = pipeline.run(OracleReply{"chit_chat", "{}"}, t);
    EXPECT_EQ(other.reply, "I'm ready to help you add subtitles!");
    EXPECT_EQ(t.size(), size_t(1));
}

TEST(EditPipelineTest, Failures) {
    EditPipeline pipeline;
    Timeline t;
    pipeline.run(OracleReply{"add_subtitle", R"({"text": "One", "end_time": "4"})"}, t);
    const auto before = t;

    EXPECT_THROW(
        pipeline.run(
            OracleReply{"modify_subtitle", R"({"subtitle_index": 5, "text": "x"})"}, t),
        index_out_of_range_error);
    EXPECT_THROW(
        pipeline.run(OracleReply{"modify_subtitle", R"({"start_time": "10"})"}, t),
        invalid_timing_error);
    EXPECT_THROW(
        pipeline.run(OracleReply{"add_subtitle", R"({"font_size": 200})"}, t), compile_error);

    EXPECT_EQ(t, before);
}

TEST(EditPipelineTest, Oracle) {
    EditPipeline pipeline;
    Timeline t;
    ScriptedOracle oracle(OracleReply{"add_subtitle", R"({"text": "Hi"})"});

    EXPECT_EQ(timeline_context(t.subtitles()), "There are no subtitles yet.");

    auto r = pipeline.run(oracle, "add hi", t);
    EXPECT_EQ(oracle.last_message_, "add hi");
    EXPECT_EQ(oracle.last_context_, "There are no subtitles yet.");
    EXPECT_EQ(r.kind, MK_INSERT);

    pipeline.run(oracle, "again", t);
    EXPECT_EQ(
        oracle.last_context_,
        "Current subtitles (1):\n1. \"Hi\" 0.00s-3.00s white 32px bottom");
}
