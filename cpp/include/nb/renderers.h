// cpp/include/nb/renderers.h
#pragma once
#include <cstdint>
#include <functional>

#include "nb/glossary.h"
#include "nb/interner.h"
#include "nb/registry.h"
#include "nb/section.h"
#include "nb/section_id.h"

namespace nb {

class Rng;

struct RenderOptions {
    // list of figures
    double   figures_stddev{3.0};
    int      figures_min{5};   // inclusive
    int      figures_max{30};  // exclusive
    uint32_t footnote_odds{10}; // 1 in N figures gets "(*)"

    // afterword: 1 in N is the narrator message
    uint32_t afterword_meta_odds{10000000};
};

// Everything a renderer may touch besides the registry it reads.
// Renderers allocate their own id and intern the words they produce,
// but never insert into a registry.
struct RenderContext {
    WordInterner& words;
    IdAllocator& ids;
    Rng& rng;
    RenderOptions opt;
};

Section render_chapter_1(RenderContext& ctx);
Section render_dedication(RenderContext& ctx);
Section render_fourword(RenderContext& ctx);

// Snapshot of sections in their current order.
Section render_table_of_contents(RenderContext& ctx, const SectionRegistry& sections);

// Distinct words of sections, each with its glossary definition.
// Throws NbException(UndefinedWord) for a word that is not a glossary key.
Section render_glossary(RenderContext& ctx, const Glossary& glossary, const SectionRegistry& sections);

// referenced must be the id of an existing section.
Section render_list_of_figures(RenderContext& ctx, SectionId referenced);

Section render_index(RenderContext& ctx, const SectionRegistry& sections);

// pick_section_id must return ids of existing sections.
Section render_afterword(RenderContext& ctx, const std::function<SectionId()>& pick_section_id);

} // namespace nb
