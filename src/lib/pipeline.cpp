#include "pipeline.hpp"
#include "threading.hpp"
#include <absl/strings/str_replace.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <stdexcept>

using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool all_punct(const std::string &s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::ispunct(static_cast<unsigned char>(c)) != 0;
    });
}

bool all_digits(const std::string &s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

namespace corpus {

Document WhitespacePipeline::process(const std::string &label,
                                     const std::string &text) const {
    TokenList tokens;
    Attributes attrs;

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        while (i < n && is_space(text[i])) ++i;
        if (i == n) break;

        const size_t start = i;
        while (i < n && !is_space(text[i])) ++i;
        std::string tok = text.substr(start, i - start);

        attrs.is_punct.push_back(all_punct(tok));
        attrs.like_num.push_back(all_digits(tok));
        attrs.whitespace.push_back(i < n);
        attrs.lemma.push_back(tok);
        tokens.push_back(std::move(tok));
    }

    return Document(label, std::move(tokens), std::move(attrs));
}

std::string format_label(const std::string &fmt, size_t i) {
    return absl::StrReplaceAll(fmt, {{"{i0}", std::to_string(i)},
                                     {"{i1}", std::to_string(i + 1)}});
}

Collection tokenize(const std::vector<std::string> &texts, const Context &ctx,
                    const std::vector<std::string> &labels,
                    const std::string &label_fmt) {
    if (ctx.pipeline == nullptr) {
        throw std::invalid_argument("no pipeline set in the context");
    }
    if (!labels.empty() && labels.size() != texts.size()) {
        throw std::invalid_argument("got " + std::to_string(labels.size()) +
                                    " labels for " + std::to_string(texts.size()) +
                                    " texts");
    }
    const auto start = Clock::now();

    std::vector<Document> docs(texts.size());
    threading::parallel_for(texts.size(), ctx.workers, [&](size_t i) {
        const std::string label =
            labels.empty() ? format_label(label_fmt, i) : labels[i];
        docs[i] = ctx.pipeline->process(label, texts[i]);
    });

    // Collection rejects duplicate labels
    Collection result(std::move(docs));

    if (ctx.verbose) {
        const DurationMs elapsed = Clock::now() - start;
        std::cout << "[tokenize] tokenized " << texts.size() << " documents in "
                  << elapsed.count() << " ms" << std::endl;
    }
    return result;
}

} // namespace corpus
