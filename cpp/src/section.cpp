#include "nb/section.h"

namespace nb {

const char* kind_label(SectionKind kind) {
    switch (kind) {
        case SectionKind::Dedication:      return "Dedication";
        case SectionKind::Fourword:        return "Fourword";
        case SectionKind::TableOfContents: return "Table of Contents";
        case SectionKind::Chapter1:        return "Chapter 1";
        case SectionKind::Glossary:        return "Glossary";
        case SectionKind::ListOfFigures:   return "List of Figures";
        case SectionKind::Index:           return "Index";
        case SectionKind::Afterword:       return "Afterword";
    }
    return "Section";
}

bool inserted_at_front(SectionKind kind) {
    return kind == SectionKind::Dedication
        || kind == SectionKind::Fourword
        || kind == SectionKind::TableOfContents;
}

} // namespace nb
