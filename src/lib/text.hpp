#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace text {

// Character shape classes used by str_shape()
constexpr int SHAPE_LOWER = 0;
constexpr int SHAPE_OTHER = 1;

// Number of UTF-8 encoded characters in s (invalid bytes count as one)
size_t char_length(const std::string &s);

// True if s contains at least one cased character and no lower case one
bool is_upper(const std::string &s);

// Lower case version of s (simple per-character mapping). ASCII input takes
// a fast path.
std::string to_lower(const std::string &s);

// Split s on every occurrence of every separator in split_chars.
// Consecutive separators yield empty parts.
std::vector<std::string> str_multisplit(const std::string &s,
                                        const std::vector<std::string> &split_chars);

// One entry per character: SHAPE_LOWER for lower case letters, SHAPE_OTHER
// for everything else
std::vector<int> str_shape(const std::string &s);

// Split s at letter case transitions. Chunks shorter than min_part_length
// characters are merged with their neighbours. Returns {""} for "".
std::vector<std::string> shape_split(const std::string &s,
                                     size_t min_part_length = 2);

// Options for compound token expansion
struct CompoundOptions {
    std::vector<std::string> split_chars{"-"};
    // minimum length of a resulting part; std::nullopt disables the rule
    std::optional<size_t> split_on_len = 2;
    bool split_on_casechange = false;
};

// Split a compound token like "US-Student" into {"US", "Student"}.
// Returns {token} when nothing was split.
std::vector<std::string> split_compound(const std::string &token,
                                        const std::vector<std::string> &split_chars,
                                        std::optional<size_t> split_on_len = 2,
                                        bool split_on_casechange = false);

std::vector<std::string> split_compound(const std::string &token,
                                        const CompoundOptions &options);

} // namespace text
