#pragma once

#include "corpus.hpp"
#include "matching.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace corpus {

struct KwicOptions {
    // tokens of context left and right of each match
    long left = 2;
    long right = 2;
    matching::MatchOptions match;
    // build windows around the non-matching tokens instead
    bool inverse = false;
    // if set, the matched token is wrapped in this marker on both sides
    std::optional<std::string> highlight_keyword;
    // collect the document's token attributes for every window
    bool with_attrs = false;
    // drop documents without any window from the result
    bool non_empty = false;
};

// Symmetric context size
KwicOptions kwic_options(long context_size, const matching::MatchOptions &match = {});

struct KwicWindow {
    TokenList tokens;
    // indices into the live tokens of the document
    std::vector<size_t> positions;
    // attribute columns in table order, filled only with with_attrs
    std::vector<std::pair<std::string, std::vector<AttrValue>>> attrs;
};

struct DocKwic {
    std::string label;
    std::vector<KwicWindow> windows;
};

// Keyword-in-context windows of every match of any of patterns, per document
// in collection order
std::vector<DocKwic> kwic(const Collection &docs,
                          const std::vector<std::string> &patterns,
                          const KwicOptions &options = {},
                          const Context &ctx = {});

struct DocKwicGlued {
    std::string label;
    std::vector<std::string> contexts;
};

// Like kwic(), with each window joined into one string
std::vector<DocKwicGlued> kwic_glued(const Collection &docs,
                                     const std::vector<std::string> &patterns,
                                     const KwicOptions &options = {},
                                     const std::string &glue = " ",
                                     const Context &ctx = {});

using Cell = std::variant<std::string, size_t, bool>;

// Columnar KWIC result. Without glue the columns are doc, context, position,
// token and the attribute columns; with glue they are doc, context, kwic.
struct KwicTable {
    std::vector<std::string> columns;
    std::vector<std::vector<Cell>> rows;
};

// Documents without windows never produce rows
KwicTable kwic_table(const Collection &docs,
                     const std::vector<std::string> &patterns,
                     const KwicOptions &options = {},
                     const std::optional<std::string> &glue = std::nullopt,
                     const Context &ctx = {});

// Array of row objects with keys in column order
nlohmann::ordered_json table_to_json(const KwicTable &table);

// Keep only the tokens inside a KWIC window (or with inverse, remove them).
// Matching itself is never inverted here.
void filter_tokens_with_kwic(Collection &docs,
                             const std::vector<std::string> &patterns,
                             long left, long right,
                             const matching::MatchOptions &options = {},
                             bool inverse = false);

} // namespace corpus
