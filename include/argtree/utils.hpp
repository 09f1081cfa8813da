#ifndef ARGTREE_UTILS_HPP
#define ARGTREE_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace argtree::utils {

// Edit distance over one rolling row; `diag` holds the previous row's
// value at j - 1.
inline std::size_t levenshteinDistance(std::string_view from, std::string_view to) {
    if (from.empty() || to.empty()) return from.size() + to.size();

    std::vector<std::size_t> row(to.size() + 1);
    for (std::size_t j = 0; j < row.size(); ++j) row[j] = j;

    for (std::size_t i = 0; i < from.size(); ++i) {
        std::size_t diag = row[0];
        row[0] = i + 1;
        for (std::size_t j = 1; j < row.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t substitute = diag + (from[i] == to[j - 1] ? 0 : 1);
            row[j] = std::min({above + 1, row[j - 1] + 1, substitute});
            diag = above;
        }
    }
    return row.back();
}

// Candidates within `maxDistance` edits of `input` (prefix matches score 0),
// closest first.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxDistance = 2,
                                        std::size_t maxResults = 3) {
    std::vector<std::pair<std::size_t, std::string>> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty() || input.empty()) continue;
        const std::size_t score = c.rfind(input, 0) == 0 ? 0 : levenshteinDistance(input, c);
        if (score <= maxDistance) scored.emplace_back(score, c);
    }
    std::sort(scored.begin(), scored.end());

    std::vector<std::string> out;
    for (auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (std::find(out.begin(), out.end(), s.second) == out.end()) out.push_back(std::move(s.second));
    }
    return out;
}

// Replaces `{{.Key}}` placeholders. Unknown keys render as nothing.
inline std::string renderTemplate(std::string_view tpl, const std::unordered_map<std::string, std::string>& vars) {
    std::string out;
    out.reserve(tpl.size());

    std::size_t i = 0;
    while (i < tpl.size()) {
        const auto start = tpl.find("{{.", i);
        if (start == std::string_view::npos) {
            out.append(tpl.substr(i));
            break;
        }
        out.append(tpl.substr(i, start - i));
        const auto end = tpl.find("}}", start);
        if (end == std::string_view::npos) {
            out.append(tpl.substr(start));
            break;
        }
        const auto it = vars.find(std::string(tpl.substr(start + 3, end - (start + 3))));
        if (it != vars.end()) out.append(it->second);
        i = end + 2;
    }
    return out;
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

inline std::string capitalize(std::string_view s) {
    std::string out(s);
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

} // namespace argtree::utils

#endif // ARGTREE_UTILS_HPP
