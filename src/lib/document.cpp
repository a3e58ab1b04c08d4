#include "document.hpp"
#include <algorithm>

namespace {

template <typename T>
void check_column(const std::vector<T> &column, size_t n,
                  const std::string &name) {
    if (!column.empty() && column.size() != n) {
        throw corpus::ShapeError("attribute '" + name + "' has " +
                                 std::to_string(column.size()) +
                                 " values for " + std::to_string(n) +
                                 " tokens");
    }
}

// Elements of column at positions where mask is true
template <typename T>
std::vector<T> select(const std::vector<T> &column, const corpus::Mask &mask) {
    if (column.empty()) return {};
    std::vector<T> result;
    for (size_t i = 0; i < column.size(); ++i) {
        if (mask[i]) result.push_back(column[i]);
    }
    return result;
}

} // namespace

namespace corpus {

const std::vector<std::string> &base_attribute_names() {
    static const std::vector<std::string> names = {
        "is_punct", "lemma", "like_num", "pos", "whitespace"};
    return names;
}

std::vector<std::string> Attributes::names() const {
    std::vector<std::string> result;
    if (!is_punct.empty()) result.push_back("is_punct");
    if (!lemma.empty()) result.push_back("lemma");
    if (!like_num.empty()) result.push_back("like_num");
    if (!pos.empty()) result.push_back("pos");
    if (!whitespace.empty()) result.push_back("whitespace");
    // std::map iterates in sorted order
    for (const auto &[name, column] : custom) {
        if (!column.empty()) result.push_back(name);
    }
    return result;
}

bool Attributes::has(const std::string &name) const {
    const auto names_set = names();
    return std::find(names_set.begin(), names_set.end(), name) !=
           names_set.end();
}

AttrValue Attributes::value(const std::string &name, size_t i) const {
    if (name == "is_punct" && !is_punct.empty()) return bool(is_punct.at(i));
    if (name == "lemma" && !lemma.empty()) return lemma.at(i);
    if (name == "like_num" && !like_num.empty()) return bool(like_num.at(i));
    if (name == "pos" && !pos.empty()) return pos.at(i);
    if (name == "whitespace" && !whitespace.empty()) {
        return bool(whitespace.at(i));
    }
    auto it = custom.find(name);
    if (it != custom.end() && !it->second.empty()) return it->second.at(i);
    throw std::invalid_argument("unknown token attribute '" + name + "'");
}

Document::Document(std::string label, TokenList tokens, Attributes attrs)
    : label_(std::move(label)), tokens_(std::move(tokens)),
      mask_(tokens_.size(), true), attrs_(std::move(attrs)) {
    const size_t n = tokens_.size();
    check_column(attrs_.is_punct, n, "is_punct");
    check_column(attrs_.lemma, n, "lemma");
    check_column(attrs_.like_num, n, "like_num");
    check_column(attrs_.pos, n, "pos");
    check_column(attrs_.whitespace, n, "whitespace");
    for (const auto &[name, column] : attrs_.custom) {
        check_column(column, n, name);
    }
}

size_t Document::logical_size() const {
    return static_cast<size_t>(std::count(mask_.begin(), mask_.end(), true));
}

bool Document::is_compact() const {
    return std::all_of(mask_.begin(), mask_.end(), [](bool m) { return m; });
}

TokenList Document::logical_tokens() const { return select(tokens_, mask_); }

std::vector<AttrValue> Document::logical_attr(const std::string &name) const {
    if (!attrs_.has(name)) {
        throw std::invalid_argument("document '" + label_ +
                                    "' has no token attribute '" + name + "'");
    }
    std::vector<AttrValue> values;
    for (size_t i = 0; i < tokens_.size(); ++i) {
        if (mask_[i]) values.push_back(attrs_.value(name, i));
    }
    return values;
}

std::vector<std::string>
Document::logical_attr_strings(const std::string &name) const {
    std::vector<std::string> result;
    for (const auto &v : logical_attr(name)) {
        if (std::holds_alternative<bool>(v)) {
            result.push_back(std::get<bool>(v) ? "true" : "false");
        } else {
            result.push_back(std::get<std::string>(v));
        }
    }
    return result;
}

void Document::apply_mask(const Mask &submask, bool invert) {
    const size_t live = logical_size();
    if (submask.size() != live) {
        throw ShapeError("mask of length " + std::to_string(submask.size()) +
                         " does not match the " + std::to_string(live) +
                         " live tokens of document '" + label_ + "'");
    }

    size_t j = 0;
    for (size_t i = 0; i < mask_.size(); ++i) {
        if (!mask_[i]) continue;
        mask_[i] = invert ? !submask[j] : bool(submask[j]);
        ++j;
    }
}

Document Document::compact() const {
    if (is_compact()) return *this;

    Attributes attrs;
    attrs.is_punct = select(attrs_.is_punct, mask_);
    attrs.lemma = select(attrs_.lemma, mask_);
    attrs.like_num = select(attrs_.like_num, mask_);
    attrs.pos = select(attrs_.pos, mask_);
    attrs.whitespace = select(attrs_.whitespace, mask_);
    for (const auto &[name, column] : attrs_.custom) {
        attrs.custom[name] = select(column, mask_);
    }

    return Document(label_, select(tokens_, mask_), std::move(attrs));
}

void Document::transform_tokens(
    const std::function<std::string(const std::string &)> &fn) {
    for (auto &t : tokens_) t = fn(t);
}

} // namespace corpus
