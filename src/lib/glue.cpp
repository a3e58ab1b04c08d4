#include "glue.hpp"
#include "subsequent.hpp"
#include "threading.hpp"
#include <absl/strings/str_join.h>
#include <chrono>
#include <iostream>
#include <stdexcept>

using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

namespace {

// Append the attributes of buffer position i of src to dst
void push_attrs(corpus::Attributes &dst, const corpus::Attributes &src, size_t i) {
    if (!src.is_punct.empty()) dst.is_punct.push_back(src.is_punct[i]);
    if (!src.lemma.empty()) dst.lemma.push_back(src.lemma[i]);
    if (!src.like_num.empty()) dst.like_num.push_back(src.like_num[i]);
    if (!src.pos.empty()) dst.pos.push_back(src.pos[i]);
    if (!src.whitespace.empty()) dst.whitespace.push_back(src.whitespace[i]);
    for (const auto &[name, column] : src.custom) {
        if (!column.empty()) dst.custom[name].push_back(column[i]);
    }
}

void check_runs(const std::vector<matching::Window> &runs, size_t n) {
    std::vector<bool> used(n, false);
    for (const auto &run : runs) {
        if (run.size() < 2) {
            throw std::invalid_argument("runs must span at least two tokens");
        }
        for (size_t k = 0; k < run.size(); ++k) {
            if (run[k] >= n) {
                throw std::invalid_argument("run index " + std::to_string(run[k]) +
                                            " is out of range for " +
                                            std::to_string(n) + " tokens");
            }
            if (k > 0 && run[k] != run[k - 1] + 1) {
                throw std::invalid_argument("run indices must be consecutive and ascending");
            }
            if (used[run[k]]) {
                throw std::invalid_argument("runs must not overlap; index " +
                                            std::to_string(run[k]) +
                                            " is part of more than one run");
            }
            used[run[k]] = true;
        }
    }
}

// Greedily drop runs that overlap an earlier kept run
std::vector<matching::Window>
exclusive_runs(const std::vector<matching::Window> &runs) {
    std::vector<matching::Window> kept;
    for (const auto &run : runs) {
        if (!kept.empty() && run.front() <= kept.back().back()) continue;
        kept.push_back(run);
    }
    return kept;
}

} // namespace

namespace corpus {

GlueResult glue_subsequent(const Document &doc,
                           const std::vector<matching::Window> &runs,
                           const std::string &glue) {
    if (!doc.is_compact()) {
        throw std::invalid_argument("document '" + doc.label() +
                                    "' has a pending mask; compact it before gluing");
    }
    const size_t n = doc.size();
    check_runs(runs, n);

    // run length by first index; 0 for positions not starting a run
    std::vector<size_t> run_at(n, 0);
    for (const auto &run : runs) run_at[run.front()] = run.size();

    const auto &tokens = doc.tokens();
    const auto &src = doc.attrs();

    GlueResult result;
    TokenList out_tokens;
    Attributes out_attrs;
    for (size_t i = 0; i < n;) {
        if (run_at[i] == 0) {
            out_tokens.push_back(tokens[i]);
            push_attrs(out_attrs, src, i);
            ++i;
            continue;
        }

        const size_t len = run_at[i];
        const size_t last = i + len - 1;
        std::string merged = absl::StrJoin(tokens.begin() + i,
                                           tokens.begin() + i + len, glue);

        // start from the run's last token so whitespace carries over
        push_attrs(out_attrs, src, last);
        if (!out_attrs.is_punct.empty()) out_attrs.is_punct.back() = false;
        if (!out_attrs.like_num.empty()) out_attrs.like_num.back() = false;
        if (!out_attrs.pos.empty()) out_attrs.pos.back().clear();
        if (!out_attrs.lemma.empty()) out_attrs.lemma.back() = merged;
        for (auto &[name, column] : out_attrs.custom) {
            if (!column.empty()) column.back().clear();
        }

        out_tokens.push_back(merged);
        result.glued.push_back(std::move(merged));
        i += len;
    }

    result.doc = Document(doc.label(), std::move(out_tokens), std::move(out_attrs));
    return result;
}

GlueTokensResult glue_tokens(const Collection &docs,
                             const std::vector<std::string> &patterns,
                             const std::string &glue,
                             const matching::MatchOptions &options,
                             const Context &ctx) {
    if (patterns.size() < 2) {
        throw std::invalid_argument("at least two patterns are required");
    }
    const auto start = Clock::now();

    const Collection compacted = compact_documents(docs, ctx);

    std::vector<GlueResult> per_doc(compacted.size());
    threading::parallel_for(compacted.size(), ctx.workers, [&](size_t i) {
        const auto &doc = compacted[i];
        const auto runs = matching::match_subsequent(patterns, doc.tokens(), options);
        per_doc[i] = glue_subsequent(doc, exclusive_runs(runs), glue);
    });

    GlueTokensResult result;
    size_t n_runs = 0;
    for (auto &r : per_doc) {
        n_runs += r.glued.size();
        result.glued.insert(r.glued.begin(), r.glued.end());
        result.docs.add(std::move(r.doc));
    }

    if (ctx.verbose) {
        const DurationMs elapsed = Clock::now() - start;
        std::cout << "[glue_tokens] glued " << n_runs << " runs in "
                  << elapsed.count() << " ms" << std::endl;
    }
    return result;
}

Document expand_compound_doc(const Document &doc,
                             const text::CompoundOptions &options) {
    const Document compact = doc.compact();
    const auto &tokens = compact.tokens();
    const auto &src = compact.attrs();

    TokenList out_tokens;
    Attributes out_attrs;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto parts = text::split_compound(tokens[i], options);
        if (parts.size() == 1) {
            out_tokens.push_back(tokens[i]);
            push_attrs(out_attrs, src, i);
            continue;
        }

        for (size_t p = 0; p < parts.size(); ++p) {
            out_tokens.push_back(parts[p]);
            push_attrs(out_attrs, src, i);
            if (!out_attrs.lemma.empty()) out_attrs.lemma.back() = parts[p];
            if (!out_attrs.whitespace.empty() && p + 1 < parts.size()) {
                out_attrs.whitespace.back() = false;
            }
        }
    }

    return Document(compact.label(), std::move(out_tokens), std::move(out_attrs));
}

Collection expand_compounds(const Collection &docs,
                            const text::CompoundOptions &options,
                            const Context &ctx) {
    const auto start = Clock::now();

    std::vector<Document> expanded(docs.size());
    threading::parallel_for(docs.size(), ctx.workers, [&](size_t i) {
        expanded[i] = expand_compound_doc(docs[i], options);
    });

    if (ctx.verbose) {
        const DurationMs elapsed = Clock::now() - start;
        std::cout << "[expand_compounds] expanded " << docs.size()
                  << " documents in " << elapsed.count() << " ms" << std::endl;
    }
    return Collection(std::move(expanded));
}

} // namespace corpus
