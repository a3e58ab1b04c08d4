#include "filters.hpp"
#include "text.hpp"
#include <absl/container/flat_hash_set.h>
#include <algorithm>
#include <functional>
#include <stdexcept>

namespace {

std::function<bool(double, double)> df_comparison(const std::string &which) {
    if (which == "common" || which == ">=") return std::greater_equal<double>();
    if (which == ">") return std::greater<double>();
    if (which == "uncommon" || which == "<=") return std::less_equal<double>();
    if (which == "<") return std::less<double>();
    throw std::invalid_argument("which must be one of: common, >, >=, "
                                "uncommon, <, <=; got '" + which + "'");
}

// Flags from a boolean attribute of the live tokens
corpus::Mask flag_attr(const corpus::Document &doc, const std::string &name) {
    corpus::Mask flags;
    if (doc.logical_size() == 0) return flags;
    for (const auto &v : doc.logical_attr(name)) {
        flags.push_back(std::get<bool>(v));
    }
    return flags;
}

} // namespace

namespace corpus {

std::vector<matching::MatchVector>
pattern_matches(const Collection &docs, const std::vector<std::string> &patterns,
                const matching::MatchOptions &options,
                const std::string &by_attr) {
    std::vector<matching::MatchVector> result;
    result.reserve(docs.size());
    for (const auto &doc : docs) {
        if (by_attr.empty()) {
            result.push_back(matching::match_any(patterns, doc.logical_tokens(), options));
        } else if (doc.logical_size() == 0) {
            result.emplace_back();
        } else {
            result.push_back(matching::match_any(
                patterns, doc.logical_attr_strings(by_attr), options));
        }
    }
    return result;
}

void filter_tokens_by_mask(Collection &docs, const std::vector<Mask> &masks,
                           bool inverse) {
    if (masks.size() != docs.size()) {
        throw std::invalid_argument(
            "got " + std::to_string(masks.size()) + " masks for " +
            std::to_string(docs.size()) + " documents");
    }
    // check every shape first so a failure leaves all documents untouched
    for (size_t i = 0; i < docs.size(); ++i) {
        if (masks[i].size() != docs[i].logical_size()) {
            throw ShapeError("mask " + std::to_string(i) + " has length " +
                             std::to_string(masks[i].size()) + " but document '" +
                             docs[i].label() + "' has " +
                             std::to_string(docs[i].logical_size()) +
                             " live tokens");
        }
    }
    for (size_t i = 0; i < docs.size(); ++i) {
        docs[i].apply_mask(masks[i], inverse);
    }
}

void remove_tokens_by_mask(Collection &docs, const std::vector<Mask> &masks) {
    filter_tokens_by_mask(docs, masks, true);
}

void filter_tokens(Collection &docs, const std::vector<std::string> &patterns,
                   const matching::MatchOptions &options, bool inverse,
                   const std::string &by_attr) {
    filter_tokens_by_mask(docs, pattern_matches(docs, patterns, options, by_attr),
                          inverse);
}

void remove_tokens(Collection &docs, const std::vector<std::string> &patterns,
                   const matching::MatchOptions &options,
                   const std::string &by_attr) {
    filter_tokens(docs, patterns, options, true, by_attr);
}

Collection filter_documents(const Collection &docs,
                            const std::vector<std::string> &patterns,
                            const matching::MatchOptions &options,
                            size_t matches_threshold, bool inverse_result,
                            bool inverse_matches, const std::string &by_attr) {
    const auto matches = pattern_matches(docs, patterns, options, by_attr);

    Collection result;
    for (size_t i = 0; i < docs.size(); ++i) {
        const size_t n_true = static_cast<size_t>(
            std::count(matches[i].begin(), matches[i].end(), true));
        const size_t n_matches =
            inverse_matches ? matches[i].size() - n_true : n_true;
        const bool threshold_met = n_matches >= matches_threshold;
        if (threshold_met != inverse_result) result.add(docs[i]);
    }
    return result;
}

Collection remove_documents(const Collection &docs,
                            const std::vector<std::string> &patterns,
                            const matching::MatchOptions &options,
                            size_t matches_threshold, bool inverse_matches,
                            const std::string &by_attr) {
    return filter_documents(docs, patterns, options, matches_threshold, true,
                            inverse_matches, by_attr);
}

Collection filter_documents_by_name(const Collection &docs,
                                    const std::vector<std::string> &name_patterns,
                                    const matching::MatchOptions &options,
                                    bool inverse) {
    const auto matches =
        matching::match_any(name_patterns, doc_labels(docs), options);

    Collection result;
    for (size_t i = 0; i < docs.size(); ++i) {
        if (matches[i] != inverse) result.add(docs[i]);
    }
    return result;
}

Collection remove_documents_by_name(const Collection &docs,
                                    const std::vector<std::string> &name_patterns,
                                    const matching::MatchOptions &options) {
    return filter_documents_by_name(docs, name_patterns, options, true);
}

std::string simplified_pos(const std::string &pos, const std::string &tagset,
                           const std::string &default_tag) {
    auto starts_with = [&pos](const char *prefix) {
        return pos.rfind(prefix, 0) == 0;
    };

    if (tagset == "ud") {
        if (pos == "NOUN" || pos == "PROPN") return "N";
        if (pos == "VERB") return "V";
        if (pos == "ADJ" || pos == "ADV") return pos;
        return default_tag;
    }
    if (tagset == "penn") {
        if (starts_with("N") || starts_with("V")) return pos.substr(0, 1);
        if (starts_with("JJ")) return "ADJ";
        if (starts_with("RB")) return "ADV";
        return default_tag;
    }
    if (tagset == "wn") {
        if (starts_with("N") || starts_with("V")) return pos.substr(0, 1);
        if (starts_with("ADJ") || starts_with("ADV")) return pos.substr(0, 3);
        return default_tag;
    }
    throw std::invalid_argument("unknown tagset '" + tagset + "'");
}

void filter_for_pos(Collection &docs, const std::vector<std::string> &required_pos,
                    bool simplify_pos, const std::string &tagset, bool inverse) {
    // fail on an unknown tagset even for empty collections
    simplified_pos("", tagset);

    const absl::flat_hash_set<std::string> required(required_pos.begin(),
                                                    required_pos.end());
    std::vector<Mask> masks;
    masks.reserve(docs.size());
    for (const auto &doc : docs) {
        Mask m;
        if (doc.logical_size() > 0) {
            for (const auto &tag : doc.logical_attr_strings("pos")) {
                m.push_back(required.contains(
                    simplify_pos ? simplified_pos(tag, tagset) : tag));
            }
        }
        masks.push_back(std::move(m));
    }
    filter_tokens_by_mask(docs, masks, inverse);
}

std::vector<std::string> doc_frequency_blacklist(const Collection &docs,
                                                 const std::string &which,
                                                 double df_threshold,
                                                 bool absolute) {
    const auto compare = df_comparison(which);
    const double n_docs = static_cast<double>(docs.size());

    if (absolute) {
        if (df_threshold < 0 || df_threshold > n_docs) {
            throw std::invalid_argument("df_threshold must be in range [0, " +
                                        std::to_string(docs.size()) + "]");
        }
    } else if (df_threshold < 0 || df_threshold > 1) {
        throw std::invalid_argument("df_threshold must be in range [0, 1]");
    }

    std::vector<std::string> blacklist;
    for (const auto &[t, n] : doc_frequencies(docs)) {
        const double df = absolute ? static_cast<double>(n)
                                   : static_cast<double>(n) / n_docs;
        if (compare(df, df_threshold)) blacklist.push_back(t);
    }
    std::sort(blacklist.begin(), blacklist.end());
    return blacklist;
}

void remove_tokens_by_doc_frequency(Collection &docs, const std::string &which,
                                    double df_threshold, bool absolute) {
    const auto blacklist = doc_frequency_blacklist(docs, which, df_threshold, absolute);
    const absl::flat_hash_set<std::string> remove(blacklist.begin(),
                                                  blacklist.end());

    std::vector<Mask> masks;
    masks.reserve(docs.size());
    for (const auto &doc : docs) {
        Mask m;
        for (const auto &t : doc.logical_tokens()) m.push_back(remove.contains(t));
        masks.push_back(std::move(m));
    }
    remove_tokens_by_mask(docs, masks);
}

void remove_common_tokens(Collection &docs, double df_threshold, bool absolute) {
    remove_tokens_by_doc_frequency(docs, "common", df_threshold, absolute);
}

void remove_uncommon_tokens(Collection &docs, double df_threshold,
                            bool absolute) {
    remove_tokens_by_doc_frequency(docs, "uncommon", df_threshold, absolute);
}

void clean_tokens(Collection &docs, const CleanOptions &options) {
    absl::flat_hash_set<std::string> remove_set(options.punct_tokens.begin(),
                                                options.punct_tokens.end());
    remove_set.insert(options.stopwords.begin(), options.stopwords.end());
    if (options.remove_empty) remove_set.insert("");

    std::vector<Mask> masks;
    masks.reserve(docs.size());
    for (const auto &doc : docs) {
        const auto tokens = doc.logical_tokens();
        Mask remove(tokens.size(), false);

        if (options.remove_punct && !tokens.empty()) {
            const auto punct = flag_attr(doc, "is_punct");
            for (size_t i = 0; i < tokens.size(); ++i) {
                if (punct[i]) remove[i] = true;
            }
        }

        if (options.remove_numbers && !tokens.empty()) {
            const auto numbers = flag_attr(doc, "like_num");
            for (size_t i = 0; i < tokens.size(); ++i) {
                if (numbers[i]) remove[i] = true;
            }
        }

        for (size_t i = 0; i < tokens.size(); ++i) {
            if (remove_set.contains(tokens[i])) {
                remove[i] = true;
                continue;
            }
            if (options.remove_shorter_than || options.remove_longer_than) {
                const size_t len = text::char_length(tokens[i]);
                if (options.remove_shorter_than && len < *options.remove_shorter_than) {
                    remove[i] = true;
                }
                if (options.remove_longer_than && len > *options.remove_longer_than) {
                    remove[i] = true;
                }
            }
        }

        masks.push_back(std::move(remove));
    }

    remove_tokens_by_mask(docs, masks);
}

} // namespace corpus
