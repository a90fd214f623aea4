// SPDX-License-Identifier: Apache-2.0
#include <filesystem>
#include <gtest/gtest.h>

#include "cuecraft/error.hpp"
#include "cuecraft/session/session_store.hpp"
#include "cuecraft/utility/json_store.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft;
using namespace cuecraft::session;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

namespace fs = std::filesystem;

namespace {
const Subtitles sample{Subtitle("a", "One", 0.0, 2.0), Subtitle("b", "Two", 2.0, 4.0)};

void exercise_store(SessionStore &store) {
    EXPECT_FALSE(store.get("sess_1"));
    EXPECT_FALSE(store.contains("sess_1"));
    EXPECT_TRUE(store.keys().empty());

    store.put("sess_1", sample);
    store.put("sess_2", Subtitles());

    EXPECT_TRUE(store.contains("sess_1"));
    EXPECT_EQ(store.get("sess_1"), sample);
    EXPECT_EQ(store.get("sess_2"), Subtitles());
    EXPECT_EQ(store.keys(), std::vector<std::string>({"sess_1", "sess_2"}));

    store.put("sess_1", Subtitles{sample[1]});
    EXPECT_EQ(store.get("sess_1")->size(), size_t(1));

    EXPECT_TRUE(store.erase("sess_1"));
    EXPECT_FALSE(store.erase("sess_1"));
    EXPECT_FALSE(store.contains("sess_1"));
    EXPECT_EQ(store.keys(), std::vector<std::string>({"sess_2"}));
}
} // namespace

TEST(SessionStoreTest, SessionId) {
    const auto id = generate_session_id();
    EXPECT_TRUE(starts_with(id, "sess_"));
    EXPECT_EQ(id.size(), size_t(21));
    EXPECT_NE(id, generate_session_id());
}

TEST(SessionStoreTest, Memory) {
    MemorySessionStore store;
    exercise_store(store);
}

TEST(SessionStoreTest, File) {
    const auto dir = fs::temp_directory_path() / "cuecraft_session_store_test";
    fs::remove_all(dir);

    {
        FileSessionStore store(dir);
        EXPECT_TRUE(fs::is_directory(store.directory()));
        exercise_store(store);
    }

    // survives a new store on the same directory
    {
        FileSessionStore store(dir);
        store.put("sess_3", sample);
    }
    {
        FileSessionStore store(dir);
        EXPECT_EQ(store.get("sess_3"), sample);

        auto jsn = read_json_file(dir / "sess_3.json");
        EXPECT_EQ(jsn.at("version"), 1);
        EXPECT_EQ(jsn.at("session_id"), "sess_3");
        EXPECT_EQ(jsn.at("timeline").at("subtitles").size(), size_t(2));
    }

    fs::remove_all(dir);
}

TEST(SessionStoreTest, FileInvalidId) {
    const auto dir = fs::temp_directory_path() / "cuecraft_session_store_invalid_test";
    fs::remove_all(dir);

    FileSessionStore store(dir);
    EXPECT_FALSE(store.contains("../escape"));
    EXPECT_FALSE(store.contains(""));
    EXPECT_THROW(store.put("../escape", sample), session_missing_error);
    EXPECT_THROW(static_cast<void>(store.get("a/b")), session_missing_error);

    fs::remove_all(dir);
}
