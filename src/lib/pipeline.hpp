#pragma once

#include "corpus.hpp"
#include "document.hpp"
#include <string>
#include <vector>

namespace corpus {

// Turns raw text into a tokenized document with per-token attributes.
// Implementations must be safe to call concurrently.
class Pipeline {
  public:
    virtual ~Pipeline() = default;
    virtual Document process(const std::string &label,
                             const std::string &text) const = 0;
};

// Splits on ASCII whitespace. Sets is_punct for tokens made only of ASCII
// punctuation, like_num for digit-only tokens, whitespace for tokens
// followed by whitespace and lemma = token.
class WhitespacePipeline : public Pipeline {
  public:
    Document process(const std::string &label,
                     const std::string &text) const override;
};

// Label for the document at index i: "{i0}" and "{i1}" in fmt are replaced
// by the zero- and one-based index
std::string format_label(const std::string &fmt, size_t i);

// Tokenize texts with ctx.pipeline. labels, if given, must have one unique
// entry per text; otherwise labels are generated from label_fmt.
// Throws std::invalid_argument if ctx has no pipeline.
Collection tokenize(const std::vector<std::string> &texts, const Context &ctx,
                    const std::vector<std::string> &labels = {},
                    const std::string &label_fmt = "doc-{i1}");

} // namespace corpus
