// SPDX-License-Identifier: Apache-2.0
#include <algorithm>
#include <array>
#include <functional>
#include <random>

#include "cuecraft/utility/uuid.hpp"
#include "cuecraft/utility/string_helpers.hpp"

using namespace cuecraft::utility;

namespace {
uuids::uuid random_uuid() {
    thread_local std::mt19937 engine = [] {
        std::random_device rd;
        std::array<int, std::mt19937::state_size> seed_data{};
        std::generate(std::begin(seed_data), std::end(seed_data), std::ref(rd));
        std::seed_seq seq(std::begin(seed_data), std::end(seed_data));
        return std::mt19937(seq);
    }();
    thread_local uuids::uuid_random_generator gen{engine};
    return gen();
}
} // namespace

void Uuid::generate_in_place() { uuid_ = random_uuid(); }

std::string Uuid::hex() const {
    const auto bytes = uuid_.as_bytes();
    return make_hex_string(
        reinterpret_cast<const uint8_t *>(bytes.data()),
        reinterpret_cast<const uint8_t *>(bytes.data()) + bytes.size(),
        false);
}

std::string cuecraft::utility::to_string(const Uuid &uuid) {
    return uuids::to_string(uuid.uuid_);
}

std::string cuecraft::utility::generate_id(const std::string &prefix, const size_t digits) {
    return prefix + "_" + Uuid::generate().hex().substr(0, std::min<size_t>(digits, 32));
}
