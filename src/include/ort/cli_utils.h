#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace ort {
namespace cli_utils {

// Single-character edits (insert, delete, substitute) turning `a` into `b`.
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known option, or "" when nothing is within max(3, 40% of the
// argument's length) edits.
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    size_t best_distance = 0;
    for (auto const& opt : options) {
        size_t d = edit_distance(arg, opt);
        if (best.empty() or d < best_distance) {
            best = opt;
            best_distance = d;
        }
    }
    size_t limit = std::max<size_t>(3, arg.size() * 2 / 5);
    return (not best.empty() and best_distance <= limit) ? best : std::string();
}

inline std::string unknown_argument_message(const std::string& arg,
                                            const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string hint = closest_option(arg, options);
    if (not hint.empty()) msg += "\n  Did you mean '" + hint + "'?";
    return msg;
}

}  // namespace cli_utils
}  // namespace ort
