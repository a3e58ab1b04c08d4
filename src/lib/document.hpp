#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace corpus {

using TokenList = std::vector<std::string>;
using Mask = std::vector<bool>;

// Value of a single per-token attribute
using AttrValue = std::variant<bool, std::string>;

// Thrown when a mask does not fit the document it is applied to
class ShapeError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Per-token attributes supplied by the NLP pipeline. Every column is either
// empty (not supplied) or exactly as long as the token buffer.
struct Attributes {
    std::vector<bool> is_punct;
    std::vector<std::string> lemma;
    std::vector<bool> like_num;
    std::vector<std::string> pos;
    std::vector<bool> whitespace;
    std::map<std::string, std::vector<std::string>> custom;

    // Names of the supplied columns: base attributes (sorted) first, then
    // custom attributes (sorted)
    std::vector<std::string> names() const;

    bool has(const std::string &name) const;

    // Value of attribute name at buffer position i
    AttrValue value(const std::string &name, size_t i) const;
};

// Base attribute names in column order
const std::vector<std::string> &base_attribute_names();

// A tokenized document: a dense token buffer plus a parallel mask that
// selects the live tokens. Filtering narrows the mask; only compaction
// shrinks the buffer.
class Document {
  public:
    Document() = default;
    explicit Document(std::string label, TokenList tokens = {},
                      Attributes attrs = {});

    const std::string &label() const { return label_; }
    const TokenList &tokens() const { return tokens_; }
    const Mask &mask() const { return mask_; }
    const Attributes &attrs() const { return attrs_; }

    // Buffer length
    size_t size() const { return tokens_.size(); }
    // Number of live tokens
    size_t logical_size() const;
    // True if every token in the buffer is live
    bool is_compact() const;

    TokenList logical_tokens() const;
    // Values of attribute name for the live tokens
    std::vector<AttrValue> logical_attr(const std::string &name) const;
    // String values of attribute name for the live tokens; flags become
    // "true" / "false"
    std::vector<std::string> logical_attr_strings(const std::string &name) const;

    // Narrow the mask. submask has one entry per live token (or, with
    // invert, per live token to drop). Throws ShapeError on a length
    // mismatch.
    void apply_mask(const Mask &submask, bool invert = false);

    // New document holding only the live tokens and their attributes
    Document compact() const;

    // Replace every token string by fn(token)
    void transform_tokens(const std::function<std::string(const std::string &)> &fn);

  private:
    std::string label_;
    TokenList tokens_;
    Mask mask_;
    Attributes attrs_;
};

} // namespace corpus
