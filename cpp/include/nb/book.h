// cpp/include/nb/book.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "nb/glossary.h"
#include "nb/interner.h"
#include "nb/random.h"
#include "nb/registry.h"
#include "nb/renderers.h"
#include "nb/section_id.h"

namespace nb {

struct BookOptions {
    size_t word_minimum{50000};

    // empty => seeded from std::random_device
    std::optional<uint64_t> seed;

    RenderOptions render;

    // progress lines on stderr
    bool verbose{false};
};

// BookOptions with verbose taken from NB_VERBOSE (1/0/true/false).
BookOptions book_options_from_env();

// Owns all state of one run: interner, glossary, ids and the growing registry.
class BookAssembler {
public:
    // Builds the global glossary and registers the Chapter 1 section.
    explicit BookAssembler(BookOptions opt);

    // Renders one section against the current registry and inserts it
    // at the end its kind belongs to. Chapter1 is registered by the
    // constructor only; passing it throws NbException(InvalidArgs).
    const Section& add(SectionKind kind);

    // Adds uniformly chosen sections until word_minimum is reached.
    void run();

    const SectionRegistry& sections() const { return sections_; }
    const Glossary& glossary() const { return glossary_; }
    const WordInterner& words() const { return words_; }
    const BookOptions& options() const { return opt_; }

    size_t total_word_count() const { return sections_.total_word_count(); }

private:
    Section render(SectionKind kind);
    const Section& insert(Section s);

    BookOptions opt_;
    Rng rng_;
    WordInterner words_;
    Glossary glossary_;
    IdAllocator ids_;
    SectionRegistry sections_;
};

BookAssembler generate_book(const BookOptions& opt);

// Section contents in registry order, separated by a blank line.
std::string render_book_text(const SectionRegistry& sections);

} // namespace nb
