#include "kwic.hpp"
#include "filters.hpp"
#include "threading.hpp"
#include "window.hpp"
#include <absl/strings/str_join.h>
#include <algorithm>
#include <chrono>
#include <iostream>

using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

namespace {

corpus::KwicWindow build_window(const corpus::TokenList &tokens,
                                const std::vector<std::vector<corpus::AttrValue>> &attr_values,
                                const std::vector<std::string> &attr_names,
                                const matching::Window &win, size_t match_pos,
                                const corpus::KwicOptions &options) {
    corpus::KwicWindow w;
    w.positions = win;
    w.tokens.reserve(win.size());
    for (size_t j : win) {
        if (j == match_pos && options.highlight_keyword) {
            const auto &marker = *options.highlight_keyword;
            w.tokens.push_back(marker + tokens[j] + marker);
        } else {
            w.tokens.push_back(tokens[j]);
        }
    }

    for (size_t a = 0; a < attr_names.size(); ++a) {
        std::vector<corpus::AttrValue> column;
        column.reserve(win.size());
        for (size_t j : win) column.push_back(attr_values[a][j]);
        w.attrs.emplace_back(attr_names[a], std::move(column));
    }
    return w;
}

corpus::DocKwic doc_kwic(const corpus::Document &doc,
                         const matching::MatchVector &matches,
                         const corpus::KwicOptions &options) {
    corpus::DocKwic result;
    result.label = doc.label();

    const auto tokens = doc.logical_tokens();

    std::vector<std::string> attr_names;
    std::vector<std::vector<corpus::AttrValue>> attr_values;
    if (options.with_attrs && !tokens.empty()) {
        attr_names = doc.attrs().names();
        for (const auto &name : attr_names) {
            attr_values.push_back(doc.logical_attr(name));
        }
    }

    std::vector<size_t> match_positions;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (matches[i]) match_positions.push_back(i);
    }

    const auto windows = matching::windows_around(matches, options.left, options.right);
    result.windows.reserve(windows.size());
    for (size_t k = 0; k < windows.size(); ++k) {
        result.windows.push_back(build_window(tokens, attr_values, attr_names,
                                              windows[k], match_positions[k],
                                              options));
    }
    return result;
}

corpus::Cell to_cell(const corpus::AttrValue &v) {
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    return std::get<std::string>(v);
}

} // namespace

namespace corpus {

KwicOptions kwic_options(long context_size, const matching::MatchOptions &match) {
    KwicOptions options;
    options.left = context_size;
    options.right = context_size;
    options.match = match;
    return options;
}

std::vector<DocKwic> kwic(const Collection &docs,
                          const std::vector<std::string> &patterns,
                          const KwicOptions &options, const Context &ctx) {
    if (options.left < 0 || options.right < 0) {
        throw std::invalid_argument("context size must be >= 0");
    }
    const auto start = Clock::now();

    auto matches = pattern_matches(docs, patterns, options.match);
    if (options.inverse) {
        for (auto &m : matches) m.flip();
    }

    std::vector<DocKwic> per_doc(docs.size());
    threading::parallel_for(docs.size(), ctx.workers, [&](size_t i) {
        per_doc[i] = doc_kwic(docs[i], matches[i], options);
    });

    std::vector<DocKwic> result;
    size_t n_windows = 0;
    for (auto &d : per_doc) {
        n_windows += d.windows.size();
        if (options.non_empty && d.windows.empty()) continue;
        result.push_back(std::move(d));
    }

    if (ctx.verbose) {
        const DurationMs elapsed = Clock::now() - start;
        std::cout << "[kwic] " << n_windows << " windows in " << docs.size()
                  << " documents in " << elapsed.count() << " ms" << std::endl;
    }
    return result;
}

std::vector<DocKwicGlued> kwic_glued(const Collection &docs,
                                     const std::vector<std::string> &patterns,
                                     const KwicOptions &options,
                                     const std::string &glue,
                                     const Context &ctx) {
    std::vector<DocKwicGlued> result;
    for (auto &d : kwic(docs, patterns, options, ctx)) {
        DocKwicGlued g;
        g.label = std::move(d.label);
        g.contexts.reserve(d.windows.size());
        for (const auto &w : d.windows) {
            g.contexts.push_back(absl::StrJoin(w.tokens, glue));
        }
        result.push_back(std::move(g));
    }
    return result;
}

KwicTable kwic_table(const Collection &docs,
                     const std::vector<std::string> &patterns,
                     const KwicOptions &options,
                     const std::optional<std::string> &glue,
                     const Context &ctx) {
    KwicOptions opts = options;
    opts.non_empty = true;
    if (glue) opts.with_attrs = false;

    KwicTable table;
    if (glue) {
        table.columns = {"doc", "context", "kwic"};
        for (const auto &d : kwic_glued(docs, patterns, opts, *glue, ctx)) {
            for (size_t c = 0; c < d.contexts.size(); ++c) {
                table.rows.push_back({d.label, c, d.contexts[c]});
            }
        }
        return table;
    }

    table.columns = {"doc", "context", "position", "token"};
    const auto results = kwic(docs, patterns, opts, ctx);

    // union of attribute columns over all documents, in table order
    if (opts.with_attrs) {
        const auto &base_names = base_attribute_names();
        std::vector<std::string> base, custom;
        for (const auto &d : results) {
            if (d.windows.empty()) continue;
            for (const auto &[name, values] : d.windows.front().attrs) {
                auto &target = std::find(base_names.begin(), base_names.end(),
                                         name) != base_names.end()
                                   ? base
                                   : custom;
                if (std::find(target.begin(), target.end(), name) == target.end()) {
                    target.push_back(name);
                }
            }
        }
        std::sort(base.begin(), base.end());
        std::sort(custom.begin(), custom.end());
        table.columns.insert(table.columns.end(), base.begin(), base.end());
        table.columns.insert(table.columns.end(), custom.begin(), custom.end());
    }

    for (const auto &d : results) {
        for (size_t c = 0; c < d.windows.size(); ++c) {
            const auto &w = d.windows[c];
            for (size_t k = 0; k < w.tokens.size(); ++k) {
                std::vector<Cell> row = {d.label, c, w.positions[k], w.tokens[k]};
                for (size_t col = 4; col < table.columns.size(); ++col) {
                    auto it = std::find_if(w.attrs.begin(), w.attrs.end(),
                                           [&](const auto &a) {
                                               return a.first == table.columns[col];
                                           });
                    // attribute not supplied for this document
                    row.push_back(it == w.attrs.end() ? Cell(std::string())
                                                      : to_cell(it->second[k]));
                }
                table.rows.push_back(std::move(row));
            }
        }
    }
    return table;
}

nlohmann::ordered_json table_to_json(const KwicTable &table) {
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (const auto &row : table.rows) {
        nlohmann::ordered_json obj = nlohmann::ordered_json::object();
        for (size_t c = 0; c < table.columns.size(); ++c) {
            std::visit([&](const auto &v) { obj[table.columns[c]] = v; }, row[c]);
        }
        rows.push_back(std::move(obj));
    }
    return rows;
}

void filter_tokens_with_kwic(Collection &docs,
                             const std::vector<std::string> &patterns,
                             long left, long right,
                             const matching::MatchOptions &options,
                             bool inverse) {
    std::vector<Mask> masks;
    masks.reserve(docs.size());
    for (const auto &m : pattern_matches(docs, patterns, options)) {
        masks.push_back(matching::window_mask(m, left, right));
    }
    filter_tokens_by_mask(docs, masks, inverse);
}

} // namespace corpus
