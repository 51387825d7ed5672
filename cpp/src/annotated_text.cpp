#include "nb/annotated_text.h"

#include "text_common.h"

namespace nb {

AnnotatedText annotate(WordInterner& interner, std::string raw) {
    std::vector<TokenSpan> spans;
    spans.reserve(raw.size() / 4 + 1);
    find_word_spans(raw, spans);

    std::vector<WordId> words;
    words.reserve(spans.size());

    std::string lowered;
    for (const auto& sp : spans) {
        to_lower_ascii_to(std::string_view(raw).substr(sp.start, sp.len), lowered);
        words.push_back(interner.intern(lowered));
    }
    return AnnotatedText(std::move(raw), std::move(words));
}

} // namespace nb
