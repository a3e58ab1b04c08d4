#pragma once

#include "document.hpp"
#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace corpus {

class Pipeline;

// Settings shared by corpus-level operations. There is no global pipeline:
// tokenize() uses the one passed here.
struct Context {
    const Pipeline *pipeline = nullptr;
    // worker threads for per-document work (1 = run inline)
    size_t workers = 1;
    // print progress and timing lines on stdout
    bool verbose = false;
};

// Ordered sequence of documents with unique labels
class Collection {
  public:
    Collection() = default;
    explicit Collection(std::vector<Document> docs);

    // Append doc. Throws std::invalid_argument on a duplicate label.
    void add(Document doc);

    size_t size() const { return docs_.size(); }
    bool empty() const { return docs_.empty(); }

    // Replace the document at position i. Throws std::out_of_range for a bad
    // position and std::invalid_argument if another document has doc's label.
    void replace(size_t i, Document doc);

    // Mutable access is for in-place edits (masks, tokens). Use replace() to
    // put a different document in place, since labels are indexed.
    Document &operator[](size_t i) { return docs_[i]; }
    const Document &operator[](size_t i) const { return docs_[i]; }

    // Lookup by label. Throws std::out_of_range for unknown labels.
    Document &at(const std::string &label);
    const Document &at(const std::string &label) const;
    bool contains(const std::string &label) const;

    std::vector<Document>::iterator begin() { return docs_.begin(); }
    std::vector<Document>::iterator end() { return docs_.end(); }
    std::vector<Document>::const_iterator begin() const { return docs_.begin(); }
    std::vector<Document>::const_iterator end() const { return docs_.end(); }

    const std::vector<Document> &documents() const { return docs_; }

  private:
    std::vector<Document> docs_;
    absl::flat_hash_map<std::string, size_t> index_;
};

using Counts = absl::flat_hash_map<std::string, size_t>;
using Proportions = absl::flat_hash_map<std::string, double>;

std::vector<std::string> doc_labels(const Collection &docs);
std::vector<size_t> doc_lengths(const Collection &docs);

// Distinct live tokens; sorted or in order of first occurrence
std::vector<std::string> vocabulary(const Collection &docs, bool sort = false);

// Occurrences of each live token across all documents
Counts vocabulary_counts(const Collection &docs);

// Number of documents in which each token occurs at least once
Counts doc_frequencies(const Collection &docs);
// doc_frequencies() divided by the number of documents
Proportions doc_frequency_proportions(const Collection &docs);

// Sliding n-grams over the live tokens of each document. A document shorter
// than n yields a single n-gram of all its tokens, an empty one yields none.
// Throws std::invalid_argument if n < 2.
std::vector<std::vector<TokenList>> ngrams(const Collection &docs, size_t n);
std::vector<std::vector<std::string>> ngrams_joined(const Collection &docs,
                                                    size_t n,
                                                    const std::string &join_str = " ");

using TokenId = uint32_t;

struct TokenIds {
    // sorted vocabulary; a token's id is its index here
    std::vector<std::string> vocab;
    std::vector<std::vector<TokenId>> docs;
    // occurrences of each vocabulary entry
    std::vector<size_t> counts;
};

TokenIds tokens2ids(const Collection &docs);
std::vector<TokenList> ids2tokens(const std::vector<std::string> &vocab,
                                  const std::vector<std::vector<TokenId>> &ids);

// Input for an external document-term-matrix builder: the sorted vocabulary
// and, in collection order, each document's live tokens
struct DtmInput {
    std::vector<std::string> vocab;
    std::vector<std::string> labels;
    std::vector<TokenList> docs;
};

DtmInput dtm_input(const Collection &docs);

// New collection with every document compacted
Collection compact_documents(const Collection &docs, const Context &ctx = {});

// Rewrite token strings in place
void transform(Collection &docs,
               const std::function<std::string(const std::string &)> &fn);
void to_lowercase(Collection &docs);
// Remove every occurrence of the given characters from all tokens.
// Throws std::invalid_argument if chars is empty.
void remove_chars(Collection &docs, const std::vector<std::string> &chars);

} // namespace corpus
