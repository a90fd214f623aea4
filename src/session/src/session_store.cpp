// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "cuecraft/error.hpp"
#include "cuecraft/session/session_store.hpp"
#include "cuecraft/utility/json_store.hpp"
#include "cuecraft/utility/logging.hpp"
#include "cuecraft/utility/uuid.hpp"

using namespace cuecraft;
using namespace cuecraft::session;
using namespace cuecraft::subtitle;
using namespace cuecraft::utility;

namespace fs = std::filesystem;

namespace {
const int SESSION_FILE_VERSION = 1;

bool valid_session_id(const std::string &session_id) {
    return not session_id.empty() and
           std::all_of(session_id.begin(), session_id.end(), [](const char c) {
               return std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_';
           });
}
} // namespace

std::string cuecraft::session::generate_session_id() { return generate_id("sess", 16); }

std::optional<Subtitles> MemorySessionStore::get(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return {};

    return it->second;
}

void MemorySessionStore::put(const std::string &session_id, const Subtitles &timeline) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session_id] = timeline;
}

bool MemorySessionStore::erase(const std::string &session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

bool MemorySessionStore::contains(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::vector<std::string> MemorySessionStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto &i : sessions_)
        result.push_back(i.first);

    return result;
}

FileSessionStore::FileSessionStore(fs::path directory) : directory_(std::move(directory)) {
    fs::create_directories(directory_);
}

fs::path FileSessionStore::session_path(const std::string &session_id) const {
    if (not valid_session_id(session_id))
        throw session_missing_error(fmt::format("Invalid session id \"{}\"", session_id));

    return directory_ / (session_id + ".json");
}

std::optional<Subtitles> FileSessionStore::get(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto path = session_path(session_id);
    if (not fs::exists(path))
        return {};

    auto jsn = read_json_file(path);
    return subtitles_from_json(JsonStore(jsn.at("timeline").at("subtitles")));
}

void FileSessionStore::put(const std::string &session_id, const Subtitles &timeline) {
    std::lock_guard<std::mutex> lock(mutex_);

    JsonStore jsn;
    jsn["version"]                = SESSION_FILE_VERSION;
    jsn["session_id"]             = session_id;
    jsn["timeline"]["subtitles"] = serialise_subtitles(timeline);

    write_json_file(session_path(session_id), jsn);
}

bool FileSessionStore::erase(const std::string &session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::remove(session_path(session_id));
}

bool FileSessionStore::contains(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return valid_session_id(session_id) and fs::exists(session_path(session_id));
}

std::vector<std::string> FileSessionStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto &entry : fs::directory_iterator(directory_)) {
        if (fs::is_regular_file(entry.status()) and entry.path().extension() == ".json")
            result.push_back(entry.path().stem().string());
    }
    std::sort(result.begin(), result.end());

    return result;
}
