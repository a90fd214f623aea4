// SPDX-License-Identifier: Apache-2.0
#include <caf/all.hpp>
#include <gtest/gtest.h>

#include "cuecraft/atoms.hpp"
#include "cuecraft/error.hpp"
#include "cuecraft/session/session_store.hpp"
#include "cuecraft/session/timeline_actor.hpp"
#include "cuecraft/utility/helpers.hpp"

using namespace std::chrono_literals;
using namespace cuecraft;
using namespace cuecraft::edit;
using namespace cuecraft::session;
using namespace cuecraft::silence;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

using namespace caf;

#include "cuecraft/utility/serialise_headers.hpp"

ACTOR_TEST_SETUP()

namespace {
class FlakyStore : public MemorySessionStore {
  public:
    void put(const std::string &session_id, const Subtitles &timeline) override {
        if (fail_)
            throw cuecraft_err("store offline");
        MemorySessionStore::put(session_id, timeline);
    }

    bool fail_{false};
};
} // namespace

TEST(TimelineActorTest, Edit) {
    fixture f;
    auto store = std::make_shared<MemorySessionStore>();
    auto tmp   = f.self->spawn<TimelineActor>("sess_test", store);

    EXPECT_EQ(request_receive<std::string>(*(f.self), tmp, name_atom_v), "sess_test");
    EXPECT_TRUE(request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v).empty());

    auto added = request_receive<EditResult>(
        *(f.self),
        tmp,
        edit_atom_v,
        std::string("add_subtitle"),
        std::string(R"({"text": "Hello", "start_time": "5", "end_time": "8"})"));
    EXPECT_EQ(added.kind, MK_INSERT);
    EXPECT_EQ(added.count, size_t(1));

    auto first = request_receive<EditResult>(
        *(f.self),
        tmp,
        edit_atom_v,
        std::string("add_subtitle"),
        JsonStore(R"({"text": "First", "start_time": "1"})"_json));
    EXPECT_EQ(first.index, size_t(1));

    auto subs = request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v);
    ASSERT_EQ(subs.size(), size_t(2));
    EXPECT_EQ(subs[0].text(), "Hello");

    auto sorted = request_receive<Subtitles>(*(f.self), tmp, chronological_atom_v);
    EXPECT_EQ(sorted[0].text(), "First");

    EXPECT_EQ(store->get("sess_test"), subs) << "Committed changes reach the store";

    auto help = request_receive<EditResult>(
        *(f.self), tmp, edit_atom_v, std::string("help"), std::string("{}"));
    EXPECT_FALSE(help.changed());

    auto jsn = request_receive<JsonStore>(*(f.self), tmp, serialise_atom_v);
    EXPECT_EQ(jsn.at("session_id"), "sess_test");
    EXPECT_EQ(jsn.at("timeline").at("subtitles").size(), size_t(2));

    f.self->send_exit(tmp, caf::exit_reason::user_shutdown);
}

TEST(TimelineActorTest, Errors) {
    fixture f;
    auto store = std::make_shared<FlakyStore>();
    store->put("sess_test", {Subtitle("a", "One", 0.0, 2.0)});

    auto tmp = f.self->spawn<TimelineActor>("sess_test", store);
    EXPECT_EQ(request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v).size(), size_t(1))
        << "Loads the stored timeline";

    try {
        request_receive<EditResult>(
            *(f.self),
            tmp,
            edit_atom_v,
            std::string("modify_subtitle"),
            std::string(R"({"subtitle_index": 4, "text": "x"})"));
        FAIL() << "Should throw";
    } catch (const CueCraftError &err) {
        EXPECT_TRUE(err.is(cuecraft_error::index_out_of_range));
    }

    try {
        request_receive<EditResult>(
            *(f.self),
            tmp,
            edit_atom_v,
            std::string("modify_subtitle"),
            std::string(R"({"start_time": "10"})"));
        FAIL() << "Should throw";
    } catch (const CueCraftError &err) {
        EXPECT_TRUE(err.is(cuecraft_error::invalid_timing));
    }

    try {
        request_receive<EditResult>(
            *(f.self),
            tmp,
            edit_atom_v,
            std::string("add_subtitle"),
            std::string(R"({"font_size": 100})"));
        FAIL() << "Should throw";
    } catch (const CueCraftError &err) {
        EXPECT_TRUE(err.is(cuecraft_error::compile_error));
    }

    // store refuses, in memory state rolls back
    store->fail_ = true;
    EXPECT_THROW(
        request_receive<EditResult>(
            *(f.self),
            tmp,
            edit_atom_v,
            std::string("add_subtitle"),
            std::string(R"({"text": "Two"})")),
        CueCraftError);
    EXPECT_THROW(request_receive<bool>(*(f.self), tmp, clear_atom_v), CueCraftError);
    store->fail_ = false;

    EXPECT_EQ(request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v).size(), size_t(1));

    f.self->send_exit(tmp, caf::exit_reason::user_shutdown);
}

TEST(TimelineActorTest, ReplaceValidateClear) {
    fixture f;
    auto store = std::make_shared<MemorySessionStore>();
    auto tmp   = f.self->spawn<TimelineActor>("sess_test", store);

    auto kept = request_receive<size_t>(
        *(f.self),
        tmp,
        replace_atom_v,
        Subtitles{
            Subtitle("a", "One", 0.0, 3.0),
            Subtitle("b", "Two", 2.0, 4.0),
            Subtitle("c", "Bad", 5.0, 5.0)});
    EXPECT_EQ(kept, size_t(2));

    auto issues = request_receive<std::vector<std::string>>(*(f.self), tmp, validate_atom_v);
    ASSERT_EQ(issues.size(), size_t(1));
    EXPECT_EQ(issues[0], "Subtitle a overlaps with b");

    EXPECT_TRUE(request_receive<bool>(*(f.self), tmp, clear_atom_v));
    EXPECT_TRUE(request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v).empty());
    EXPECT_TRUE(store->get("sess_test")->empty());

    f.self->send_exit(tmp, caf::exit_reason::user_shutdown);
}

TEST(TimelineActorTest, Compact) {
    fixture f;
    auto store = std::make_shared<MemorySessionStore>();
    store->put(
        "sess_test",
        {Subtitle("a", "Before", 0.0, 1.5),
         Subtitle("b", "After", 5.0, 6.0),
         Subtitle("c", "Lost", 3.0, 4.0)});

    auto tmp = f.self->spawn<TimelineActor>("sess_test", store);

    auto result = request_receive<CompactResult>(
        *(f.self), tmp, compact_atom_v, SilenceIntervals{TimeInterval(2.0, 4.0)}, 10.0);

    EXPECT_EQ(result.keep.size(), size_t(2));
    EXPECT_EQ(result.dropped, size_t(1));
    ASSERT_EQ(result.subtitles.size(), size_t(2));
    EXPECT_EQ(result.subtitles[1].start_time(), 3.0);
    EXPECT_DOUBLE_EQ(result.stats.total_silence_duration, 2.0);

    auto subs = request_receive<Subtitles>(*(f.self), tmp, subtitles_atom_v);
    EXPECT_EQ(subs, result.subtitles);
    EXPECT_EQ(store->get("sess_test"), subs);

    f.self->send_exit(tmp, caf::exit_reason::user_shutdown);
}

TEST(TimelineActorTest, History) {
    fixture f;
    auto tmp = f.self->spawn<TimelineActor>("sess_test", std::make_shared<MemorySessionStore>());

    EXPECT_TRUE(request_receive<ChatHistory>(*(f.self), tmp, history_atom_v).empty());

    EXPECT_TRUE(request_receive<bool>(
        *(f.self), tmp, history_atom_v, std::string("user"), std::string("add hello")));
    EXPECT_TRUE(request_receive<bool>(
        *(f.self), tmp, history_atom_v, std::string("assistant"), std::string("Added")));

    auto history = request_receive<ChatHistory>(*(f.self), tmp, history_atom_v);
    ASSERT_EQ(history.size(), size_t(2));
    EXPECT_EQ(history[0].first, "user");
    EXPECT_EQ(history[1].second, "Added");

    f.self->send_exit(tmp, caf::exit_reason::user_shutdown);
}
