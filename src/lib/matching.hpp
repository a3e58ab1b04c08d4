#pragma once

#include <string>
#include <vector>

namespace matching {

// One flag per token; true where the token matched
using MatchVector = std::vector<bool>;

enum class MatchType { Exact, Regex, Glob };

// Glob anchoring: Match anchors at the token start, Search matches anywhere
enum class GlobMethod { Match, Search };

struct MatchOptions {
    MatchType type = MatchType::Exact;
    bool ignore_case = false;
    GlobMethod glob_method = GlobMethod::Match;
};

// Parse "exact", "regex" or "glob". Throws std::invalid_argument otherwise.
MatchType parse_match_type(const std::string &name);
// Parse "match" or "search". Throws std::invalid_argument otherwise.
GlobMethod parse_glob_method(const std::string &name);

const char *to_string(MatchType type);
const char *to_string(GlobMethod method);

// Translate a shell-style glob ("*", "?", "[abc]", "[!abc]") into an
// equivalent regular expression matching the same strings.
std::string glob_to_regex(const std::string &glob);

// Match a single pattern against every token
MatchVector token_match(const std::string &pattern,
                        const std::vector<std::string> &tokens,
                        const MatchOptions &options = {});

// Logical OR of token_match() over all patterns
MatchVector match_any(const std::vector<std::string> &patterns,
                      const std::vector<std::string> &tokens,
                      const MatchOptions &options = {});

} // namespace matching
