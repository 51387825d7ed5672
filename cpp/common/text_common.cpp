// cpp/common/text_common.cpp
#include "text_common.h"

namespace {

static inline bool is_ascii_alpha(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static inline bool is_ascii_lower(unsigned char c) {
    return c >= 'a' && c <= 'z';
}

static inline bool is_ascii_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

static inline char lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') return (char)(c - 'A' + 'a');
    return c;
}

static inline char upper_ascii(char c) {
    if (c >= 'a' && c <= 'z') return (char)(c - 'a' + 'A');
    return c;
}

// Length of the word token starting at i (s[i] must be a letter).
template <class Pred>
static size_t word_len_at(std::string_view s, size_t i, Pred is_letter) {
    const size_t n = s.size();
    const size_t start = i;

    while (i < n && is_letter((unsigned char)s[i])) ++i;

    // apostrophe groups: only if a letter follows
    while (i + 1 < n && s[i] == '\'' && is_letter((unsigned char)s[i + 1])) {
        ++i;
        while (i < n && is_letter((unsigned char)s[i])) ++i;
    }
    return i - start;
}

} // namespace

void find_word_spans(std::string_view s, std::vector<TokenSpan>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        if (!is_ascii_alpha((unsigned char)s[i])) {
            ++i;
            continue;
        }
        const size_t len = word_len_at(s, i, is_ascii_alpha);

        TokenSpan ts;
        ts.start = (uint32_t)i;
        ts.len = (uint32_t)len;
        out.push_back(ts);

        i += len;
    }
}

void to_lower_ascii_to(std::string_view s, std::string& out) {
    out.clear();
    out.reserve(s.size());
    for (char c : s) out.push_back(lower_ascii(c));
}

std::string to_lower_ascii(std::string_view s) {
    std::string out;
    to_lower_ascii_to(s, out);
    return out;
}

std::string to_title_case(std::string_view s) {
    std::string out(s);
    if (!out.empty()) out[0] = upper_ascii(out[0]);
    return out;
}

bool is_lower_word(std::string_view s) {
    if (s.empty() || !is_ascii_lower((unsigned char)s[0])) return false;
    return word_len_at(s, 0, is_ascii_lower) == s.size();
}

void find_hash_refs(std::string_view s, std::vector<uint64_t>& out) {
    out.clear();
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        if (s[i] != '#' || i + 1 >= n || !is_ascii_digit((unsigned char)s[i + 1])) {
            ++i;
            continue;
        }
        ++i;
        uint64_t v = 0;
        bool overflow = false;
        while (i < n && is_ascii_digit((unsigned char)s[i])) {
            v = v * 10 + (uint64_t)(s[i] - '0');
            if (v > 0xFFFFFFFFull) overflow = true;
            ++i;
        }
        if (!overflow) out.push_back(v);
    }
}
