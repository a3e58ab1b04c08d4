#pragma once

#include "matching.hpp"
#include "window.hpp"
#include <string>
#include <vector>

namespace matching {

// Find every run of len(patterns) consecutive tokens where token k matches
// patterns[k]. Each returned run holds ascending, consecutive indices into
// tokens, ordered by position.
//
// Example:
//   tokens = {"hello", "world", "means", "saying", "hello", "world", "."}
//   match_subsequent({"hello", "world"}, tokens)  -> {{0, 1}, {4, 5}}
//   match_subsequent({"world", "*"}, tokens, glob) -> {{1, 2}, {5, 6}}
//
// Throws std::invalid_argument if fewer than two patterns are given.
std::vector<Window> match_subsequent(const std::vector<std::string> &patterns,
                                     const std::vector<std::string> &tokens,
                                     const MatchOptions &options = {});

} // namespace matching
