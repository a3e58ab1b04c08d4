#include "corpus.hpp"
#include "text.hpp"
#include "threading.hpp"
#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_join.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

namespace corpus {

Collection::Collection(std::vector<Document> docs) {
    docs_.reserve(docs.size());
    for (auto &doc : docs) add(std::move(doc));
}

void Collection::add(Document doc) {
    if (index_.contains(doc.label())) {
        throw std::invalid_argument("duplicate document label '" +
                                    doc.label() + "'");
    }
    index_.emplace(doc.label(), docs_.size());
    docs_.push_back(std::move(doc));
}

void Collection::replace(size_t i, Document doc) {
    if (i >= docs_.size()) {
        throw std::out_of_range("document position " + std::to_string(i) +
                                " out of range");
    }
    auto it = index_.find(doc.label());
    if (it != index_.end() && it->second != i) {
        throw std::invalid_argument("duplicate document label '" +
                                    doc.label() + "'");
    }
    index_.erase(docs_[i].label());
    index_.emplace(doc.label(), i);
    docs_[i] = std::move(doc);
}

Document &Collection::at(const std::string &label) {
    auto it = index_.find(label);
    if (it == index_.end()) {
        throw std::out_of_range("no document with label '" + label + "'");
    }
    return docs_[it->second];
}

const Document &Collection::at(const std::string &label) const {
    auto it = index_.find(label);
    if (it == index_.end()) {
        throw std::out_of_range("no document with label '" + label + "'");
    }
    return docs_[it->second];
}

bool Collection::contains(const std::string &label) const {
    return index_.contains(label);
}

std::vector<std::string> doc_labels(const Collection &docs) {
    std::vector<std::string> labels;
    labels.reserve(docs.size());
    for (const auto &doc : docs) labels.push_back(doc.label());
    return labels;
}

std::vector<size_t> doc_lengths(const Collection &docs) {
    std::vector<size_t> lengths;
    lengths.reserve(docs.size());
    for (const auto &doc : docs) lengths.push_back(doc.logical_size());
    return lengths;
}

std::vector<std::string> vocabulary(const Collection &docs, bool sort) {
    absl::flat_hash_set<std::string> seen;
    std::vector<std::string> vocab;
    for (const auto &doc : docs) {
        for (auto &t : doc.logical_tokens()) {
            if (seen.insert(t).second) vocab.push_back(std::move(t));
        }
    }
    if (sort) std::sort(vocab.begin(), vocab.end());
    return vocab;
}

Counts vocabulary_counts(const Collection &docs) {
    Counts counts;
    for (const auto &doc : docs) {
        for (const auto &t : doc.logical_tokens()) ++counts[t];
    }
    return counts;
}

Counts doc_frequencies(const Collection &docs) {
    Counts df;
    for (const auto &doc : docs) {
        const auto tokens = doc.logical_tokens();
        absl::flat_hash_set<std::string> unique(tokens.begin(), tokens.end());
        for (const auto &t : unique) ++df[t];
    }
    return df;
}

Proportions doc_frequency_proportions(const Collection &docs) {
    Proportions result;
    const double n_docs = static_cast<double>(docs.size());
    for (const auto &[t, n] : doc_frequencies(docs)) {
        result[t] = static_cast<double>(n) / n_docs;
    }
    return result;
}

std::vector<std::vector<TokenList>> ngrams(const Collection &docs, size_t n) {
    if (n < 2) throw std::invalid_argument("n must be at least 2");

    std::vector<std::vector<TokenList>> result;
    result.reserve(docs.size());
    for (const auto &doc : docs) {
        const auto tokens = doc.logical_tokens();
        std::vector<TokenList> doc_ngrams;
        if (tokens.size() < n) {
            if (!tokens.empty()) doc_ngrams.push_back(tokens);
        } else {
            for (size_t i = 0; i + n <= tokens.size(); ++i) {
                doc_ngrams.emplace_back(tokens.begin() + i,
                                        tokens.begin() + i + n);
            }
        }
        result.push_back(std::move(doc_ngrams));
    }
    return result;
}

std::vector<std::vector<std::string>> ngrams_joined(const Collection &docs,
                                                    size_t n,
                                                    const std::string &join_str) {
    std::vector<std::vector<std::string>> result;
    for (const auto &doc_ngrams : ngrams(docs, n)) {
        std::vector<std::string> joined;
        joined.reserve(doc_ngrams.size());
        for (const auto &g : doc_ngrams) {
            joined.push_back(absl::StrJoin(g, join_str));
        }
        result.push_back(std::move(joined));
    }
    return result;
}

TokenIds tokens2ids(const Collection &docs) {
    TokenIds result;
    result.vocab = vocabulary(docs, true);

    absl::flat_hash_map<std::string, TokenId> ids;
    ids.reserve(result.vocab.size());
    for (size_t i = 0; i < result.vocab.size(); ++i) {
        ids.emplace(result.vocab[i], static_cast<TokenId>(i));
    }

    result.counts.assign(result.vocab.size(), 0);
    result.docs.reserve(docs.size());
    for (const auto &doc : docs) {
        std::vector<TokenId> doc_ids;
        for (const auto &t : doc.logical_tokens()) {
            const TokenId id = ids.at(t);
            doc_ids.push_back(id);
            ++result.counts[id];
        }
        result.docs.push_back(std::move(doc_ids));
    }
    return result;
}

std::vector<TokenList> ids2tokens(const std::vector<std::string> &vocab,
                                  const std::vector<std::vector<TokenId>> &ids) {
    std::vector<TokenList> result;
    result.reserve(ids.size());
    for (const auto &doc_ids : ids) {
        TokenList tokens;
        tokens.reserve(doc_ids.size());
        for (TokenId id : doc_ids) {
            if (id >= vocab.size()) {
                throw std::out_of_range("token id " + std::to_string(id) +
                                        " is not in the vocabulary");
            }
            tokens.push_back(vocab[id]);
        }
        result.push_back(std::move(tokens));
    }
    return result;
}

DtmInput dtm_input(const Collection &docs) {
    DtmInput result;
    result.vocab = vocabulary(docs, true);
    result.labels = doc_labels(docs);
    result.docs.reserve(docs.size());
    for (const auto &doc : docs) result.docs.push_back(doc.logical_tokens());
    return result;
}

Collection compact_documents(const Collection &docs, const Context &ctx) {
    const auto start = Clock::now();

    std::vector<Document> compacted(docs.size());
    threading::parallel_for(docs.size(), ctx.workers, [&](size_t i) {
        compacted[i] = docs[i].compact();
    });

    if (ctx.verbose) {
        const DurationMs elapsed = Clock::now() - start;
        std::cout << "[compact_documents] compacted " << docs.size()
                  << " documents in " << elapsed.count() << " ms" << std::endl;
    }
    return Collection(std::move(compacted));
}

void transform(Collection &docs,
               const std::function<std::string(const std::string &)> &fn) {
    for (auto &doc : docs) doc.transform_tokens(fn);
}

void to_lowercase(Collection &docs) { transform(docs, text::to_lower); }

void remove_chars(Collection &docs, const std::vector<std::string> &chars) {
    if (chars.empty()) {
        throw std::invalid_argument("chars must be a non-empty sequence");
    }
    transform(docs, [&chars](const std::string &t) {
        std::string result = t;
        for (const auto &c : chars) {
            if (c.empty()) continue;
            size_t pos;
            while ((pos = result.find(c)) != std::string::npos) {
                result.erase(pos, c.size());
            }
        }
        return result;
    });
}

} // namespace corpus
