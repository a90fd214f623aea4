// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <fstream>
#include <vector>

#include <fmt/format.h>

#include "cuecraft/error.hpp"
#include "cuecraft/utility/json_store.hpp"

using namespace cuecraft;
using namespace cuecraft::utility;

using json_pointer = nlohmann::json::json_pointer;

namespace {
void merge_into(nlohmann::json &dst, const nlohmann::json &src) {
    if (not dst.is_object() or not src.is_object()) {
        dst = src;
        return;
    }

    for (auto it = src.begin(); it != src.end(); ++it) {
        if (dst.contains(it.key()))
            merge_into(dst[it.key()], it.value());
        else
            dst[it.key()] = it.value();
    }
}
} // namespace

JsonStore::JsonStore(nlohmann::json json) : nlohmann::json(std::move(json)) {}

nlohmann::json JsonStore::get(const std::string &path) const { return at(json_pointer(path)); }

void JsonStore::set(const nlohmann::json &json, const std::string &path) {
    (*this)[json_pointer(path)] = json;
}

bool JsonStore::remove(const std::string &path) {
    const auto ptr = json_pointer(path);
    if (ptr.empty() or not contains(ptr))
        return false;

    auto &parent = at(ptr.parent_pointer());
    if (parent.is_object())
        return parent.erase(ptr.back()) != 0;

    try {
        parent.erase(std::stoul(ptr.back()));
    } catch (const std::exception &err) {
        spdlog::debug("{} {} {}", __PRETTY_FUNCTION__, path, err.what());
        return false;
    }
    return true;
}

void JsonStore::merge(const nlohmann::json &json, const std::string &path) {
    const auto ptr = json_pointer(path);
    if (not contains(ptr)) {
        set(json, path);
        return;
    }
    merge_into(at(ptr), json);
}

std::string cuecraft::utility::to_string(const JsonStore &x) { return x.dump(); }

void cuecraft::utility::to_json(nlohmann::json &j, const JsonStore &c) {
    j = static_cast<const nlohmann::json &>(c);
}

void cuecraft::utility::from_json(const nlohmann::json &j, JsonStore &c) { c = JsonStore(j); }

JsonStore cuecraft::utility::read_json_file(const fs::path &path) {
    std::ifstream i(path);
    if (not i.is_open())
        throw cuecraft_err(fmt::format("Failed to open {}", path.string()));

    return JsonStore(nlohmann::json::parse(i));
}

void cuecraft::utility::write_json_file(
    const fs::path &path, const JsonStore &json, const int pad) {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream o(tmp);
        if (not o.is_open())
            throw cuecraft_err(fmt::format("Failed to write {}", tmp.string()));
        o << json.dump(pad);
        if (not o)
            throw cuecraft_err(fmt::format("Failed to write {}", tmp.string()));
    }
    fs::rename(tmp, path);
}

JsonStore cuecraft::utility::merge_json_from_path(const fs::path &path, JsonStore merged) {
    std::vector<fs::path> files;

    try {
        for (const auto &entry : fs::directory_iterator(path)) {
            if (entry.is_regular_file() and entry.path().extension() == ".json")
                files.push_back(entry.path());
        }
    } catch (const fs::filesystem_error &err) {
        spdlog::warn("Preference path does not exist {}. ({})", path.string(), err.what());
        return merged;
    }

    std::sort(files.begin(), files.end());

    for (const auto &i : files) {
        try {
            merged.merge(read_json_file(i));
        } catch (const std::exception &err) {
            spdlog::warn("{} {} {}", __PRETTY_FUNCTION__, i.string(), err.what());
        }
    }

    return merged;
}
