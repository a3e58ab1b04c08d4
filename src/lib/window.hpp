#pragma once

#include "matching.hpp"
#include <cstddef>
#include <vector>

namespace matching {

// Ascending indices into the live tokens of one document
using Window = std::vector<size_t>;

// For every match at index i, the range [i - left, i + right] clipped to the
// bounds of matches. One window per match, in ascending order of i; windows
// of neighbouring matches may overlap.
// Throws std::invalid_argument if left or right is negative.
std::vector<Window> windows_around(const MatchVector &matches, long left,
                                   long right);

// All windows of windows_around() concatenated. With remove_overlaps the
// result is sorted and free of duplicates.
std::vector<size_t> flat_windows_around(const MatchVector &matches, long left,
                                        long right,
                                        bool remove_overlaps = true);

// Keep-mask of the same length as matches: true inside any window
MatchVector window_mask(const MatchVector &matches, long left, long right);

} // namespace matching
