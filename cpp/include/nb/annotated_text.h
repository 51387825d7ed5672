// cpp/include/nb/annotated_text.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "nb/interner.h"

namespace nb {

// Raw text plus the words found in it, in source order, duplicates kept.
class AnnotatedText {
public:
    AnnotatedText() = default;

    const std::string& content() const { return content_; }
    const std::vector<WordId>& words() const { return words_; }

    // occurrences, not distinct words
    size_t word_count() const { return words_.size(); }

private:
    friend AnnotatedText annotate(WordInterner& interner, std::string raw);

    AnnotatedText(std::string content, std::vector<WordId> words)
        : content_(std::move(content)), words_(std::move(words)) {}

    std::string content_;
    std::vector<WordId> words_;
};

// Tokenizes raw, lowercases and interns every token.
AnnotatedText annotate(WordInterner& interner, std::string raw);

} // namespace nb
