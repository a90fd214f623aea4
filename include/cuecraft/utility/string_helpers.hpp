// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace cuecraft {
namespace utility {

    inline std::string trim(const std::string &s) {
        const auto not_space = [](unsigned char ch) { return not std::isspace(ch); };

        const auto first = std::find_if(s.begin(), s.end(), not_space);
        if (first == s.end())
            return {};

        const auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
        return std::string(first, last);
    }

    inline std::string
    replace_all(std::string str, const std::string &from, const std::string &to) {
        if (from.empty())
            return str;

        for (auto pos = str.find(from); pos != std::string::npos;
             pos      = str.find(from, pos + to.size()))
            str.replace(pos, from.size(), to);

        return str;
    }

    //! Every field between delimiters, a trailing delimiter yields a trailing empty field.
    inline std::vector<std::string> split(const std::string &s, const char delim) {
        std::vector<std::string> fields;
        if (s.empty())
            return fields;

        size_t begin = 0;
        for (auto end = s.find(delim); end != std::string::npos; end = s.find(delim, begin)) {
            fields.push_back(s.substr(begin, end - begin));
            begin = end + 1;
        }
        fields.push_back(s.substr(begin));

        return fields;
    }

    inline bool starts_with(const std::string &haystack, const std::string &needle) {
        return haystack.size() >= needle.size() and
               std::equal(needle.begin(), needle.end(), haystack.begin());
    }

    inline bool ends_with(const std::string &haystack, const std::string &needle) {
        return haystack.size() >= needle.size() and
               std::equal(needle.rbegin(), needle.rend(), haystack.rbegin());
    }

    //! Two hex digits per byte, no separators.
    template <typename TInputIter>
    std::string make_hex_string(TInputIter first, TInputIter last, const bool upper = true) {
        std::string result;
        for (; first != last; ++first) {
            const auto byte = static_cast<unsigned int>(*first) & 0xffu;
            result += upper ? fmt::format("{:02X}", byte) : fmt::format("{:02x}", byte);
        }
        return result;
    }

    inline std::string
    join_as_string(const std::vector<std::string> &items, const std::string &separator) {
        std::string result;
        for (size_t i = 0; i < items.size(); i++) {
            if (i)
                result += separator;
            result += items[i];
        }
        return result;
    }

    inline std::string to_lower(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        return str;
    }

    inline std::string to_upper(std::string str) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        return str;
    }

    /*! Strict decimal conversion.
        Surrounding whitespace is ignored, anything else left unconsumed fails.
        Hex and non finite results (inf, nan) are rejected.
    */
    inline std::optional<double> to_double(const std::string &str) {
        const auto tmp = trim(str);
        if (tmp.empty() or tmp.find_first_of("xX") != std::string::npos)
            return {};

        char *end = nullptr;
        errno     = 0;
        auto val  = std::strtod(tmp.c_str(), &end);

        if (errno == ERANGE or end != tmp.c_str() + tmp.size() or not std::isfinite(val))
            return {};

        return val;
    }

    //! Strict integer conversion, see to_double.
    inline std::optional<long> to_long(const std::string &str) {
        const auto tmp = trim(str);
        if (tmp.empty())
            return {};

        char *end = nullptr;
        errno     = 0;
        auto val  = std::strtol(tmp.c_str(), &end, 10);

        if (errno == ERANGE or end != tmp.c_str() + tmp.size())
            return {};

        return val;
    }

} // namespace utility
} // namespace cuecraft
