#include "nb/book.h"
#include "nb/errors.h"

#include <array>
#include <cstdlib>
#include <cstring>
#include <iostream>

namespace nb {

namespace {

constexpr std::array<SectionKind, 7> kGeneratedKinds = {
    SectionKind::Dedication,
    SectionKind::Fourword,
    SectionKind::TableOfContents,
    SectionKind::Glossary,
    SectionKind::ListOfFigures,
    SectionKind::Index,
    SectionKind::Afterword,
};

static bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

static Rng make_rng(const BookOptions& opt) {
    if (opt.seed) return Rng(*opt.seed);
    return Rng();
}

} // namespace

BookOptions book_options_from_env() {
    BookOptions opt;
    opt.verbose = env_bool("NB_VERBOSE", false);
    return opt;
}

BookAssembler::BookAssembler(BookOptions opt)
    : opt_(std::move(opt)),
      rng_(make_rng(opt_)),
      glossary_(build_global_glossary(words_)) {
    if (opt_.render.figures_min >= opt_.render.figures_max) {
        throw NbException(ErrorCode::InvalidArgs, "figures_min must be below figures_max");
    }
    if (opt_.render.footnote_odds == 0 || opt_.render.afterword_meta_odds == 0) {
        throw NbException(ErrorCode::InvalidArgs, "odds must be positive");
    }
    if (opt_.verbose) {
        std::cerr << "[nb] glossary built: entries=" << glossary_.size()
                  << " words=" << words_.size() << "\n";
    }
    insert(render(SectionKind::Chapter1));
}

Section BookAssembler::render(SectionKind kind) {
    RenderContext ctx{words_, ids_, rng_, opt_.render};

    switch (kind) {
        case SectionKind::Chapter1:
            return render_chapter_1(ctx);
        case SectionKind::Dedication:
            return render_dedication(ctx);
        case SectionKind::Fourword:
            return render_fourword(ctx);
        case SectionKind::TableOfContents:
            return render_table_of_contents(ctx, sections_);
        case SectionKind::Glossary:
            return render_glossary(ctx, glossary_, sections_);
        case SectionKind::ListOfFigures:
            return render_list_of_figures(ctx, sections_.random_id(rng_));
        case SectionKind::Index:
            return render_index(ctx, sections_);
        case SectionKind::Afterword:
            return render_afterword(ctx, [this] { return sections_.random_id(rng_); });
    }
    throw NbException(ErrorCode::InvalidArgs, "unknown section kind");
}

const Section& BookAssembler::add(SectionKind kind) {
    if (kind == SectionKind::Chapter1) {
        throw NbException(ErrorCode::InvalidArgs, "a book has exactly one Chapter 1");
    }
    return insert(render(kind));
}

const Section& BookAssembler::insert(Section s) {
    const SectionKind kind = s.kind;
    const size_t words = s.word_count();
    const bool front = inserted_at_front(kind);

    sections_.insert(std::move(s));

    const Section& added = front ? sections_.at(0) : sections_.at(sections_.size() - 1);
    if (opt_.verbose) {
        std::cerr << "[nb] + " << kind_label(kind) << " #" << added.id
                  << " words=" << words << " total=" << sections_.total_word_count() << "\n";
    }
    return added;
}

void BookAssembler::run() {
    while (sections_.total_word_count() < opt_.word_minimum) {
        add(kGeneratedKinds[rng_.index(kGeneratedKinds.size())]);
    }
    if (opt_.verbose) {
        std::cerr << "[nb] done: sections=" << sections_.size()
                  << " words=" << sections_.total_word_count() << "\n";
    }
}

BookAssembler generate_book(const BookOptions& opt) {
    BookAssembler book(opt);
    book.run();
    return book;
}

std::string render_book_text(const SectionRegistry& sections) {
    std::string out;
    bool first = true;
    for (const auto& s : sections) {
        if (!first) out += "\n\n";
        out += s.content.content();
        first = false;
    }
    return out;
}

} // namespace nb
