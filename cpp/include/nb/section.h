// cpp/include/nb/section.h
#pragma once
#include <cstddef>
#include <cstdint>

#include "nb/annotated_text.h"
#include "nb/section_id.h"

namespace nb {

enum class SectionKind : uint8_t {
    Dedication,
    Fourword,
    TableOfContents,
    Chapter1,
    Glossary,
    ListOfFigures,
    Index,
    Afterword,
};

// Heading / table of contents label, e.g. "List of Figures".
const char* kind_label(SectionKind kind);

// Dedication, Fourword and TableOfContents go to the front of the book.
bool inserted_at_front(SectionKind kind);

struct Section {
    SectionId id{0};
    SectionKind kind{SectionKind::Chapter1};
    AnnotatedText content;

    size_t word_count() const { return content.word_count(); }
};

} // namespace nb
