#include "window.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

void check_radius(long left, long right) {
    if (left < 0) throw std::invalid_argument("left must be an integer >= 0");
    if (right < 0) throw std::invalid_argument("right must be an integer >= 0");
}

// Clipped bounds [first, last] of the window around index i
std::pair<size_t, size_t> window_bounds(size_t i, size_t n, long left,
                                        long right) {
    const size_t l = static_cast<size_t>(left);
    const size_t r = static_cast<size_t>(right);
    const size_t first = i >= l ? i - l : 0;
    const size_t last = std::min(n - 1, i + r);
    return {first, last};
}

} // namespace

namespace matching {

std::vector<Window> windows_around(const MatchVector &matches, long left,
                                   long right) {
    check_radius(left, right);

    std::vector<Window> windows;
    const size_t n = matches.size();
    for (size_t i = 0; i < n; ++i) {
        if (!matches[i]) continue;
        const auto [first, last] = window_bounds(i, n, left, right);
        Window w;
        w.reserve(last - first + 1);
        for (size_t j = first; j <= last; ++j) w.push_back(j);
        windows.push_back(std::move(w));
    }
    return windows;
}

std::vector<size_t> flat_windows_around(const MatchVector &matches, long left,
                                        long right, bool remove_overlaps) {
    check_radius(left, right);

    if (remove_overlaps) {
        // collecting into a mask sorts and deduplicates in one pass
        const MatchVector keep = window_mask(matches, left, right);
        std::vector<size_t> indices;
        for (size_t i = 0; i < keep.size(); ++i) {
            if (keep[i]) indices.push_back(i);
        }
        return indices;
    }

    std::vector<size_t> indices;
    for (auto &w : windows_around(matches, left, right)) {
        indices.insert(indices.end(), w.begin(), w.end());
    }
    return indices;
}

MatchVector window_mask(const MatchVector &matches, long left, long right) {
    check_radius(left, right);

    const size_t n = matches.size();
    MatchVector keep(n, false);
    for (size_t i = 0; i < n; ++i) {
        if (!matches[i]) continue;
        const auto [first, last] = window_bounds(i, n, left, right);
        for (size_t j = first; j <= last; ++j) keep[j] = true;
    }
    return keep;
}

} // namespace matching
