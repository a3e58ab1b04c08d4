#include "matching.hpp"
#include "text.hpp"
#include <memory>
#include <reflex/matcher.h>
#include <reflex/pattern.h>
#include <stdexcept>
#include <unordered_map>

using matching::GlobMethod;
using matching::MatchOptions;
using matching::MatchType;
using matching::MatchVector;

namespace {

// Thread-local RE/flex pattern cache (compiles each expression once)
thread_local std::unordered_map<std::string, std::unique_ptr<reflex::Pattern>>
    pattern_cache;

// Get/create the compiled pattern for regex with the given conversion flags
reflex::Pattern *get_pattern(const std::string &regex,
                             reflex::convert_flag_type flags) {
    const std::string key = std::to_string(flags) + ':' + regex;
    auto it = pattern_cache.find(key);
    if (it != pattern_cache.end()) return it->second.get();

    try {
        const std::string converted = reflex::Matcher::convert(regex, flags);
        auto pat = std::make_unique<reflex::Pattern>(converted);
        it = pattern_cache.emplace(key, std::move(pat)).first;
    } catch (const reflex::regex_error &e) {
        throw std::invalid_argument("invalid pattern '" + regex +
                                    "': " + e.what());
    }
    return it->second.get();
}

reflex::convert_flag_type base_flags(bool ignore_case) {
    reflex::convert_flag_type flags = reflex::convert_flag::unicode;
    if (ignore_case) flags |= reflex::convert_flag::anycase;
    return flags;
}

// Escape characters with a special meaning in regular expressions
void append_escaped(std::string &out, char c) {
    static const std::string special = "\\.^$|()[]{}*+?\"";
    if (special.find(c) != std::string::npos) out += '\\';
    out += c;
}

// Find the closing bracket of a glob character class starting at open.
// A ']' directly after '[' or '[!' is a literal member of the class.
size_t class_end(const std::string &glob, size_t open) {
    size_t i = open + 1;
    if (i < glob.size() && glob[i] == '!') ++i;
    if (i < glob.size() && glob[i] == ']') ++i;
    while (i < glob.size() && glob[i] != ']') ++i;
    return i < glob.size() ? i : std::string::npos;
}

MatchVector exact_match(const std::string &pattern,
                        const std::vector<std::string> &tokens,
                        bool ignore_case) {
    MatchVector result(tokens.size(), false);
    if (ignore_case) {
        const std::string lower_pattern = text::to_lower(pattern);
        for (size_t i = 0; i < tokens.size(); ++i) {
            result[i] = text::to_lower(tokens[i]) == lower_pattern;
        }
    } else {
        for (size_t i = 0; i < tokens.size(); ++i) {
            result[i] = tokens[i] == pattern;
        }
    }
    return result;
}

MatchVector regex_search(const std::string &pattern,
                         const std::vector<std::string> &tokens,
                         bool ignore_case) {
    // the empty expression is found in every token
    if (pattern.empty()) return MatchVector(tokens.size(), true);

    reflex::Pattern *pat = get_pattern(pattern, base_flags(ignore_case));
    MatchVector result(tokens.size(), false);
    for (size_t i = 0; i < tokens.size(); ++i) {
        // "N": empty matches count as found
        reflex::Matcher matcher(pat, reflex::Input(tokens[i]), "N");
        result[i] = matcher.find() != 0;
    }
    return result;
}

MatchVector glob_match(const std::string &pattern,
                       const std::vector<std::string> &tokens,
                       bool ignore_case, GlobMethod method) {
    // full matches of ".*" wrapped expressions give prefix/substring semantics
    std::string regex = "(?:" + matching::glob_to_regex(pattern) + ").*";
    if (method == GlobMethod::Search) regex = ".*" + regex;

    reflex::Pattern *pat =
        get_pattern(regex, base_flags(ignore_case) | reflex::convert_flag::dotall);
    MatchVector result(tokens.size(), false);
    for (size_t i = 0; i < tokens.size(); ++i) {
        reflex::Matcher matcher(pat, reflex::Input(tokens[i]));
        result[i] = matcher.matches() != 0;
    }
    return result;
}

} // namespace

namespace matching {

MatchType parse_match_type(const std::string &name) {
    if (name == "exact") return MatchType::Exact;
    if (name == "regex") return MatchType::Regex;
    if (name == "glob") return MatchType::Glob;
    throw std::invalid_argument("match type must be one of 'exact', 'regex', "
                                "'glob', got '" + name + "'");
}

GlobMethod parse_glob_method(const std::string &name) {
    if (name == "match") return GlobMethod::Match;
    if (name == "search") return GlobMethod::Search;
    throw std::invalid_argument("glob method must be one of 'match', "
                                "'search', got '" + name + "'");
}

const char *to_string(MatchType type) {
    switch (type) {
    case MatchType::Exact:
        return "exact";
    case MatchType::Regex:
        return "regex";
    case MatchType::Glob:
        return "glob";
    }
    throw std::invalid_argument("unknown match type");
}

const char *to_string(GlobMethod method) {
    switch (method) {
    case GlobMethod::Match:
        return "match";
    case GlobMethod::Search:
        return "search";
    }
    throw std::invalid_argument("unknown glob method");
}

std::string glob_to_regex(const std::string &glob) {
    std::string regex;
    regex.reserve(glob.size() * 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == '*') {
            regex += ".*";
        } else if (c == '?') {
            regex += '.';
        } else if (c == '[') {
            const size_t end = class_end(glob, i);
            if (end == std::string::npos) {
                append_escaped(regex, c);
                continue;
            }
            regex += '[';
            size_t j = i + 1;
            if (glob[j] == '!') {
                regex += '^';
                ++j;
            }
            for (; j < end; ++j) {
                if (glob[j] == '\\' || glob[j] == '[' || glob[j] == ']' ||
                    (glob[j] == '^' && regex.back() == '[')) {
                    regex += '\\';
                }
                regex += glob[j];
            }
            regex += ']';
            i = end;
        } else {
            append_escaped(regex, c);
        }
    }

    return regex;
}

MatchVector token_match(const std::string &pattern,
                        const std::vector<std::string> &tokens,
                        const MatchOptions &options) {
    // validate before looking at the input
    to_string(options.type);
    to_string(options.glob_method);

    if (tokens.empty()) return {};

    switch (options.type) {
    case MatchType::Exact:
        return exact_match(pattern, tokens, options.ignore_case);
    case MatchType::Regex:
        return regex_search(pattern, tokens, options.ignore_case);
    case MatchType::Glob:
        return glob_match(pattern, tokens, options.ignore_case,
                          options.glob_method);
    }
    return {};
}

MatchVector match_any(const std::vector<std::string> &patterns,
                      const std::vector<std::string> &tokens,
                      const MatchOptions &options) {
    MatchVector result(tokens.size(), false);
    for (const auto &pattern : patterns) {
        const auto m = token_match(pattern, tokens, options);
        for (size_t i = 0; i < m.size(); ++i) {
            if (m[i]) result[i] = true;
        }
    }
    return result;
}

} // namespace matching
