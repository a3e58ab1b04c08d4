#include "text.hpp"

#include <absl/strings/ascii.h>
#include <unicode/uchar.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr size_t npos = static_cast<size_t>(-1);

// Length of the UTF-8 sequence starting with byte c
size_t sequence_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

struct Utf8Char {
    char32_t code;
    size_t offset; // byte offset in the source string
};

// Decode s into code points. Bytes of incomplete or invalid sequences
// become single U+FFFD entries.
std::vector<Utf8Char> decode(const std::string &s) {
    std::vector<Utf8Char> chars;
    chars.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        const auto lead = static_cast<unsigned char>(s[i]);
        size_t len = sequence_length(lead);
        if (i + len > s.size()) len = 1;

        char32_t code = lead;
        if (len == 1 && lead >= 0x80) {
            code = 0xFFFD;
        } else if (len == 2) {
            code = lead & 0x1F;
        } else if (len == 3) {
            code = lead & 0x0F;
        } else if (len == 4) {
            code = lead & 0x07;
        }
        for (size_t j = 1; j < len; ++j) {
            code = (code << 6) | (static_cast<unsigned char>(s[i + j]) & 0x3F);
        }

        chars.push_back({code, i});
        i += len;
    }

    return chars;
}

// Python-style case classes: Lowercase property for lower case, titlecase
// letters count as cased but not upper case
bool is_lower_code(char32_t c) {
    return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_LOWERCASE) != 0;
}

bool is_upper_code(char32_t c) {
    return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_UPPERCASE) != 0;
}

bool is_cased_code(char32_t c) {
    return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_CASED) != 0;
}

char32_t lower_code(char32_t c) {
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(c)));
}

void append_utf8(std::string &out, char32_t c) {
    if (c < 0x80) {
        out += static_cast<char>(c);
    } else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
}

std::string substring(const std::string &s, const std::vector<Utf8Char> &chars,
                      size_t begin, size_t end) {
    const size_t first = chars[begin].offset;
    const size_t last = end < chars.size() ? chars[end].offset : s.size();
    return s.substr(first, last - first);
}

} // namespace

namespace text {

size_t char_length(const std::string &s) { return decode(s).size(); }

bool is_upper(const std::string &s) {
    bool cased = false;
    for (const auto &c : decode(s)) {
        if (is_lower_code(c.code)) return false;
        if (is_cased_code(c.code)) {
            if (!is_upper_code(c.code)) return false;
            cased = true;
        }
    }
    return cased;
}

std::string to_lower(const std::string &s) {
    const bool ascii = std::all_of(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0x80) == 0;
    });
    if (ascii) return absl::AsciiStrToLower(s);

    const auto chars = decode(s);
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < chars.size(); ++i) {
        const char32_t lower = lower_code(chars[i].code);
        if (lower != chars[i].code) {
            append_utf8(result, lower);
        } else {
            result += substring(s, chars, i, i + 1);
        }
    }
    return result;
}

std::vector<std::string> str_multisplit(const std::string &s,
                                        const std::vector<std::string> &split_chars) {
    std::vector<std::string> parts{s};

    for (const auto &sep : split_chars) {
        if (sep.empty()) {
            throw std::invalid_argument("split_chars must not contain empty strings");
        }

        std::vector<std::string> next;
        next.reserve(parts.size());
        for (const auto &p : parts) {
            size_t start = 0;
            size_t pos;
            while ((pos = p.find(sep, start)) != std::string::npos) {
                next.push_back(p.substr(start, pos - start));
                start = pos + sep.size();
            }
            next.push_back(p.substr(start));
        }
        parts = std::move(next);
    }

    return parts;
}

std::vector<int> str_shape(const std::string &s) {
    std::vector<int> shape;
    for (const auto &c : decode(s)) {
        shape.push_back(is_lower_code(c.code) ? SHAPE_LOWER : SHAPE_OTHER);
    }
    return shape;
}

std::vector<std::string> shape_split(const std::string &s,
                                     size_t min_part_length) {
    if (min_part_length < 1) {
        throw std::invalid_argument("min_part_length must be greater or equal 1");
    }

    if (s.empty()) return {""};

    const auto chars = decode(s);
    std::vector<int> shape;
    shape.reserve(chars.size());
    for (const auto &c : chars) {
        shape.push_back(is_lower_code(c.code) ? SHAPE_LOWER : SHAPE_OTHER);
    }

    const size_t len = shape.size();
    std::vector<bool> change(len, false);
    for (size_t i = 1; i < len; ++i) {
        change[i] = shape[i] != shape[i - 1];
    }

    auto next_change = [&](size_t from) -> size_t {
        for (size_t i = from; i < len; ++i) {
            if (change[i]) return i;
        }
        return npos;
    };

    std::vector<std::string> parts;
    std::vector<size_t> part_lengths; // in characters
    size_t n = 0;

    while (n < len) {
        const size_t begin = n == 0 ? 0 : next_change(n);
        if (begin == npos) break;

        // a leading lower case run may be a single character ("eMail")
        const size_t offset =
            (n == 0 && shape[0] == SHAPE_LOWER) ? n + 1 : n + min_part_length;
        size_t end = next_change(offset);
        if (end == npos) {
            end = len;
            n = len;
        } else {
            n += end - begin;
        }

        const size_t chunk_length = end - begin;
        std::string chunk = substring(s, chars, begin, end);

        if (parts.empty() || (part_lengths.back() >= min_part_length &&
                              chunk_length >= min_part_length)) {
            parts.push_back(std::move(chunk));
            part_lengths.push_back(chunk_length);
        } else {
            parts.back() += chunk;
            part_lengths.back() += chunk_length;
        }
    }

    return parts;
}

std::vector<std::string> split_compound(const std::string &token,
                                        const std::vector<std::string> &split_chars,
                                        std::optional<size_t> split_on_len,
                                        bool split_on_casechange) {
    if (split_on_len && *split_on_len < 1) {
        throw std::invalid_argument("split_on_len must be greater or equal 1");
    }

    const size_t shape_min_length = split_on_len.value_or(2);
    std::vector<std::string> t_parts;

    if (split_on_casechange && split_chars.empty()) {
        t_parts = shape_split(token, shape_min_length);
    } else {
        t_parts = str_multisplit(token, split_chars);

        if (split_on_casechange) {
            std::vector<std::string> shaped;
            for (const auto &p : t_parts) {
                auto sub = shape_split(p, shape_min_length);
                shaped.insert(shaped.end(), sub.begin(), sub.end());
            }
            t_parts = std::move(shaped);
        }
    }

    if (t_parts.size() == 1) return t_parts;

    std::vector<std::string> parts;
    bool add = false; // append the next part to the previous one

    for (const auto &p : t_parts) {
        if (p.empty()) continue;

        if (add && !parts.empty()) {
            parts.back() += p;
        } else {
            parts.push_back(p);
        }

        if (split_on_len) {
            add = char_length(p) < *split_on_len;
        }

        if (split_on_casechange) {
            // all upper case parts like "US" or "E" are glued to the next part
            add = split_on_len ? (add && is_upper(p)) : is_upper(p);
        }
    }

    // a short trailing part goes back into the previous one
    if (add && parts.size() >= 2) {
        parts[parts.size() - 2] += parts.back();
        parts.pop_back();
    }

    if (parts.empty()) return {token};
    return parts;
}

std::vector<std::string> split_compound(const std::string &token,
                                        const CompoundOptions &options) {
    return split_compound(token, options.split_chars, options.split_on_len,
                          options.split_on_casechange);
}

} // namespace text
