#include "subsequent.hpp"
#include <stdexcept>

namespace matching {

std::vector<Window> match_subsequent(const std::vector<std::string> &patterns,
                                     const std::vector<std::string> &tokens,
                                     const MatchOptions &options) {
    const size_t n_pat = patterns.size();
    if (n_pat < 2) {
        throw std::invalid_argument("patterns must contain at least two strings");
    }

    const size_t n_tok = tokens.size();
    if (n_tok == 0) return {};

    // candidates holds the indices of the tokens right after the previous
    // pattern's matches; the first pattern is tried on every token
    std::vector<size_t> candidates(n_tok);
    for (size_t i = 0; i < n_tok; ++i) candidates[i] = i;

    std::vector<size_t> matched;
    for (size_t k = 0; k < n_pat; ++k) {
        if (k > 0) {
            candidates.clear();
            for (size_t idx : matched) {
                if (idx + 1 < n_tok) candidates.push_back(idx + 1);
            }
        }

        std::vector<std::string> subset;
        subset.reserve(candidates.size());
        for (size_t idx : candidates) subset.push_back(tokens[idx]);

        const MatchVector m = token_match(patterns[k], subset, options);

        matched.clear();
        for (size_t j = 0; j < candidates.size(); ++j) {
            if (m[j]) matched.push_back(candidates[j]);
        }

        // every pattern has to match, so one empty step ends the search
        if (matched.empty()) return {};
    }

    // matched now points at the last token of each run
    std::vector<Window> runs;
    runs.reserve(matched.size());
    for (size_t last : matched) {
        Window run(n_pat);
        for (size_t j = 0; j < n_pat; ++j) run[j] = last + 1 + j - n_pat;
        runs.push_back(std::move(run));
    }
    return runs;
}

} // namespace matching
