#pragma once

#include "corpus.hpp"
#include "matching.hpp"
#include "text.hpp"
#include "window.hpp"
#include <set>
#include <string>
#include <vector>

namespace corpus {

struct GlueResult {
    Document doc;
    // merged token strings, one per run
    std::vector<std::string> glued;
};

// Merge each run of consecutive token indices into one token joined by glue,
// placed at the run's first position. The merged token's lemma is the merged
// string and its whitespace flag is the one of the run's last token; other
// attributes are reset.
// doc must be compact. Runs must hold at least two ascending consecutive
// indices inside the buffer and must not overlap. Any violation throws
// std::invalid_argument before anything is built.
GlueResult glue_subsequent(const Document &doc,
                           const std::vector<matching::Window> &runs,
                           const std::string &glue = "_");

struct GlueTokensResult {
    Collection docs;
    std::set<std::string> glued;
};

// Compact every document, then glue each run of subsequent tokens matching
// patterns. Where runs overlap, the earlier one wins.
GlueTokensResult glue_tokens(const Collection &docs,
                             const std::vector<std::string> &patterns,
                             const std::string &glue = "_",
                             const matching::MatchOptions &options = {},
                             const Context &ctx = {});

// New compact document in which every live compound token is replaced by its
// parts. Parts get lemma = part and trailing whitespace only on the last
// part; other attributes are copied from the compound.
Document expand_compound_doc(const Document &doc,
                             const text::CompoundOptions &options = {});

Collection expand_compounds(const Collection &docs,
                            const text::CompoundOptions &options = {},
                            const Context &ctx = {});

} // namespace corpus
