#pragma once

#include "corpus.hpp"
#include "matching.hpp"
#include <optional>
#include <string>
#include <vector>

namespace corpus {

// Every filter computes one sub-mask per document over its live tokens and
// narrows the document masks with it. Documents are never compacted here;
// call compact_documents() when a dense buffer is needed.

// Match patterns against the live tokens of each document, or against the
// live values of token attribute by_attr if it is non-empty. Results of
// several patterns are OR'ed.
std::vector<matching::MatchVector>
pattern_matches(const Collection &docs, const std::vector<std::string> &patterns,
                const matching::MatchOptions &options = {},
                const std::string &by_attr = "");

// masks holds one mask per document, each with one entry per live token.
// With inverse, tokens flagged true are removed instead of kept.
// Throws std::invalid_argument if the number of masks differs from the
// number of documents and ShapeError on a mask length mismatch.
void filter_tokens_by_mask(Collection &docs, const std::vector<Mask> &masks,
                           bool inverse = false);
void remove_tokens_by_mask(Collection &docs, const std::vector<Mask> &masks);

// Keep (or with inverse remove) the tokens matching any of the patterns
void filter_tokens(Collection &docs, const std::vector<std::string> &patterns,
                   const matching::MatchOptions &options = {},
                   bool inverse = false, const std::string &by_attr = "");
void remove_tokens(Collection &docs, const std::vector<std::string> &patterns,
                   const matching::MatchOptions &options = {},
                   const std::string &by_attr = "");

// Keep the documents with at least matches_threshold matching tokens.
// inverse_matches counts the non-matching tokens instead; inverse_result
// keeps the documents below the threshold.
Collection filter_documents(const Collection &docs,
                            const std::vector<std::string> &patterns,
                            const matching::MatchOptions &options = {},
                            size_t matches_threshold = 1,
                            bool inverse_result = false,
                            bool inverse_matches = false,
                            const std::string &by_attr = "");
Collection remove_documents(const Collection &docs,
                            const std::vector<std::string> &patterns,
                            const matching::MatchOptions &options = {},
                            size_t matches_threshold = 1,
                            bool inverse_matches = false,
                            const std::string &by_attr = "");

// Keep the documents whose label matches any of the patterns
Collection filter_documents_by_name(const Collection &docs,
                                    const std::vector<std::string> &name_patterns,
                                    const matching::MatchOptions &options = {},
                                    bool inverse = false);
Collection remove_documents_by_name(const Collection &docs,
                                    const std::vector<std::string> &name_patterns,
                                    const matching::MatchOptions &options = {});

// Simplified POS tag: "N", "V", "ADJ", "ADV" or default_tag.
// tagset is "ud", "penn" or "wn"; others throw std::invalid_argument.
std::string simplified_pos(const std::string &pos, const std::string &tagset = "ud",
                           const std::string &default_tag = "");

// Keep the tokens whose (optionally simplified) POS tag is in required_pos
void filter_for_pos(Collection &docs, const std::vector<std::string> &required_pos,
                    bool simplify_pos = true, const std::string &tagset = "ud",
                    bool inverse = false);

// Tokens whose document frequency compares true against df_threshold.
// which: "common" or ">=", ">", "uncommon" or "<=", "<".
// The threshold is a proportion in [0, 1], or with absolute a document
// count in [0, number of documents].
std::vector<std::string> doc_frequency_blacklist(const Collection &docs,
                                                 const std::string &which,
                                                 double df_threshold,
                                                 bool absolute = false);

void remove_tokens_by_doc_frequency(Collection &docs, const std::string &which,
                                    double df_threshold, bool absolute = false);
void remove_common_tokens(Collection &docs, double df_threshold = 0.95,
                          bool absolute = false);
void remove_uncommon_tokens(Collection &docs, double df_threshold = 0.05,
                            bool absolute = false);

struct CleanOptions {
    // remove tokens flagged by the is_punct attribute
    bool remove_punct = true;
    // additional tokens to treat as punctuation
    std::vector<std::string> punct_tokens;
    std::vector<std::string> stopwords;
    bool remove_empty = true;
    std::optional<size_t> remove_shorter_than;
    std::optional<size_t> remove_longer_than;
    // remove tokens flagged by the like_num attribute
    bool remove_numbers = false;
};

void clean_tokens(Collection &docs, const CleanOptions &options = {});

} // namespace corpus
