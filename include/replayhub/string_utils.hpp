/**
 * @file string_utils.hpp
 * @brief Case‑insensitive comparison and wildcard matching for series
 *        lookups.
 */

#pragma once

#include <boost/algorithm/string/compare.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace replayhub {

/// Ordering for maps keyed by series id or name.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return boost::algorithm::ilexicographical_compare(a, b);
    }
};

inline bool iequals(std::string_view a, std::string_view b) {
    return boost::algorithm::iequals(a, b);
}

inline std::string trim(std::string_view text) {
    return boost::algorithm::trim_copy(std::string(text));
}

/**
 * @brief Case‑insensitive wildcard match of the whole of @p text.
 *
 * `*` matches any (possibly empty) run, `?` exactly one character.  An empty
 * pattern matches everything.
 */
inline bool wildcard_match(std::string_view pattern, std::string_view text) {
    if (pattern.empty()) {
        return true;
    }
    auto same = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    };

    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || same(pattern[p], text[t]))) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace replayhub
