// cpp/common/text_common.h
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

struct TokenSpan {
    uint32_t start{0};
    uint32_t len{0};
};

// Word tokens: [A-Za-z]+ followed by any number of ('[A-Za-z]+) groups.
// "it's", "NaNoGenMo" -> one token each. Digits, punctuation, whitespace
// and a dangling apostrophe are separators.
void find_word_spans(std::string_view s, std::vector<TokenSpan>& out);

// ASCII-only lowering (reuse capacity of out)
void to_lower_ascii_to(std::string_view s, std::string& out);
std::string to_lower_ascii(std::string_view s);

// First letter upper-cased, rest untouched.
std::string to_title_case(std::string_view s);

// true iff s is a complete lowercase word token: [a-z]+('[a-z]+)*
bool is_lower_word(std::string_view s);

// Section references "#<digits>" in order of appearance.
// Values that do not fit into 32 bits are skipped.
void find_hash_refs(std::string_view s, std::vector<uint64_t>& out);
