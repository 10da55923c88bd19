#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace astkg::common {

[[nodiscard]] inline char ascii_lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), ascii_lower);
    return out;
}

/**
 * Case-insensitive wildcard match supporting:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty)
 *
 * Iterative, single fallback point per '*'; no recursion.
 */
[[nodiscard]] inline bool wildcard_match_ci(std::string_view text,
                                            std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    while (t < text.size()) {
        if (p < pattern.size() &&
            (pattern[p] == '?' || ascii_lower(pattern[p]) == ascii_lower(text[t]))) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            t = ++matchPos;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

[[nodiscard]] inline bool has_wildcards(std::string_view pattern) noexcept {
    return pattern.find_first_of("*?") != std::string_view::npos;
}

[[nodiscard]] inline bool ends_with(std::string_view text, std::string_view suffix) noexcept {
    return suffix.size() <= text.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

/**
 * Split a comma-separated list, trimming tokens and skipping empties.
 */
[[nodiscard]] inline std::vector<std::string> split_csv(std::string_view csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t pos = csv.find(',', start);
        std::string_view token =
            (pos == std::string_view::npos) ? csv.substr(start) : csv.substr(start, pos - start);
        token = trim(token);
        if (!token.empty())
            out.emplace_back(token);
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

/**
 * Break a code identifier into lower-cased words.
 * "validateUserCredentials" -> {"validate", "user", "credentials"}
 * "HTTP_client" -> {"http", "client"}
 */
[[nodiscard]] inline std::vector<std::string> split_identifier(std::string_view ident) {
    std::vector<std::string> words;
    std::string cur;
    auto flush = [&] {
        if (!cur.empty()) {
            words.push_back(to_lower(cur));
            cur.clear();
        }
    };
    for (size_t i = 0; i < ident.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(ident[i]);
        if (!std::isalnum(c)) {
            flush();
            continue;
        }
        if (std::isupper(c) && !cur.empty()) {
            const bool prevLower = std::islower(static_cast<unsigned char>(cur.back())) ||
                                   std::isdigit(static_cast<unsigned char>(cur.back()));
            const bool nextLower =
                i + 1 < ident.size() && std::islower(static_cast<unsigned char>(ident[i + 1]));
            if (prevLower || nextLower)
                flush();
        }
        cur.push_back(static_cast<char>(c));
    }
    flush();
    return words;
}

} // namespace astkg::common
