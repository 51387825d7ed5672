// registry.h first: it must compile on its own
#include "nb/registry.h"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "nb/errors.h"
#include "nb/glossary.h"
#include "nb/random.h"
#include "nb/renderers.h"

#include "text_common.h"

namespace {

struct Fixture {
    nb::WordInterner words;
    nb::Glossary glossary;
    nb::IdAllocator ids;
    nb::Rng rng;

    explicit Fixture(uint64_t seed) : glossary(nb::build_global_glossary(words)), rng(seed) {}

    nb::RenderContext ctx() { return nb::RenderContext{words, ids, rng, nb::RenderOptions{}}; }

    nb::Section make(nb::SectionId id, const std::string& text) {
        nb::Section s;
        s.id = id;
        s.kind = nb::SectionKind::Chapter1;
        s.content = nb::annotate(words, text);
        return s;
    }
};

static bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

// "See '<word>.'" of the glossary bullet for term
static std::string see_target(const std::string& content, const std::string& term) {
    const std::string key = "- **" + term + "** - See '";
    const size_t p = content.find(key);
    if (p == std::string::npos) return "";
    const size_t from = p + key.size();
    return content.substr(from, content.find(".'", from) - from);
}

static void test_index() {
    nb::WordInterner words;
    nb::IdAllocator ids;
    nb::Rng rng(1);
    nb::RenderContext ctx{words, ids, rng, nb::RenderOptions{}};

    nb::SectionRegistry reg;
    nb::Section s1{100, nb::SectionKind::Chapter1, nb::annotate(words, "cat dog")};
    nb::Section s2{7, nb::SectionKind::Afterword, nb::annotate(words, "dog")};
    reg.push_back(std::move(s1));
    reg.push_back(std::move(s2));

    nb::Section idx = nb::render_index(ctx, reg);
    assert(idx.kind == nb::SectionKind::Index);
    const std::string& c = idx.content.content();
    assert(contains(c, "## Index (#" + std::to_string(idx.id) + ")\n"));

    const std::string cat = "\n- **cat** - #100";
    const std::string dog = "\n- **dog** - #7, #100";
    assert(contains(c, cat + "\n"));
    assert(c.size() >= dog.size() && c.compare(c.size() - dog.size(), dog.size(), dog) == 0);
    assert(c.find(cat) < c.find(dog));

    // the index itself is not part of what it indexes
    assert(!contains(c, "**index**"));
}

static void test_table_of_contents() {
    Fixture f(3);
    nb::SectionRegistry reg;
    auto ctx = f.ctx();

    reg.insert(nb::render_chapter_1(ctx));
    reg.insert(nb::render_dedication(ctx));
    const nb::SectionId chapter = reg.at(1).id;
    const nb::SectionId dedication = reg.at(0).id;

    nb::Section toc = nb::render_table_of_contents(ctx, reg);
    const std::string expected =
        "## Table of Contents (#" + std::to_string(toc.id) + ")\n"
        "\n- **Dedication** (#" + std::to_string(dedication) + ")"
        "\n- **Chapter 1** (#" + std::to_string(chapter) + ")";
    assert(toc.content.content() == expected);

    const std::string before = toc.content.content();
    const nb::SectionId toc_id = toc.id;
    reg.insert(std::move(toc));
    reg.insert(nb::render_index(ctx, reg));
    reg.insert(nb::render_fourword(ctx));

    assert(reg.size() == 5);
    for (const auto& s : reg) {
        if (s.id != toc_id) continue;
        assert(s.content.content() == before);
        assert(!contains(s.content.content(), "Index"));
        assert(!contains(s.content.content(), "Fourword"));
    }
}

static void test_glossary_completeness() {
    Fixture f(5);
    nb::SectionRegistry reg;
    auto ctx = f.ctx();

    reg.insert(nb::render_chapter_1(ctx));
    reg.insert(nb::render_dedication(ctx));
    reg.insert(nb::render_list_of_figures(ctx, reg.at(0).id));
    reg.insert(nb::render_fourword(ctx));
    reg.insert(nb::render_index(ctx, reg));

    std::set<nb::WordId> used;
    for (const auto& s : reg) used.insert(s.content.words().begin(), s.content.words().end());

    nb::Section g = nb::render_glossary(ctx, f.glossary, reg);
    const std::string& c = g.content.content();
    for (nb::WordId w : used) {
        const nb::Glossary::Definition* def = f.glossary.find(w);
        assert(def);
        const std::string bullet = "\n- **" + f.words.resolve(w) + "** - ";
        if (def->has_value()) assert(contains(c, bullet));
        else assert(!contains(c, bullet));
    }

    // every bullet is a used word
    size_t bullets = 0;
    for (size_t p = c.find("\n- **"); p != std::string::npos; p = c.find("\n- **", p + 1)) ++bullets;
    size_t defined = 0;
    for (nb::WordId w : used) defined += f.glossary.find(w)->has_value() ? 1 : 0;
    assert(bullets == defined);

    assert(!contains(c, nb::kRandomSignal));
}

static void test_glossary_undefined_word() {
    Fixture f(6);
    nb::SectionRegistry reg;
    reg.push_back(f.make(1, "the zebra"));
    auto ctx = f.ctx();

    bool threw = false;
    try {
        nb::render_glossary(ctx, f.glossary, reg);
    } catch (const nb::NbException& e) {
        threw = e.code() == nb::ErrorCode::UndefinedWord && contains(e.what(), "'zebra'");
    }
    assert(threw);
}

static void test_glossary_sentinel() {
    std::set<std::string> seen;
    for (uint64_t seed = 1; seed <= 40; ++seed) {
        Fixture f(seed);
        nb::SectionRegistry reg;
        reg.push_back(f.make(1, "Random words."));
        auto ctx = f.ctx();

        nb::Section g = nb::render_glossary(ctx, f.glossary, reg);
        const std::string target = see_target(g.content.content(), "random");
        assert(!target.empty());
        assert(f.words.find(target).has_value());
        assert(contains(g.content.content(), "\n- **words** - See 'word.'"));
        seen.insert(target);
    }
    assert(seen.size() >= 2);
}

static void test_list_of_figures() {
    int with_note = 0;
    for (uint64_t seed = 1; seed <= 100; ++seed) {
        Fixture f(seed);
        auto ctx = f.ctx();
        nb::Section lof = nb::render_list_of_figures(ctx, 4242);
        const std::string& c = lof.content.content();

        size_t figures = 0;
        for (size_t p = c.find("\n- "); p != std::string::npos; p = c.find("\n- ", p + 1)) ++figures;
        assert(figures >= 5 && figures < 30);

        const bool flagged = contains(c, " (*)");
        const bool note = contains(c, "when reading section #4242.");
        assert(flagged == note);
        if (note) ++with_note;

        std::vector<uint64_t> refs;
        find_hash_refs(c, refs);
        for (uint64_t r : refs) assert(r == lof.id || r == 4242);
    }
    assert(with_note > 0);
}

static void test_afterword() {
    {
        Fixture f(8);
        auto ctx = f.ctx();
        nb::Section a = nb::render_afterword(ctx, [] { return nb::SectionId(1); });
        assert(a.word_count() == 2);
        assert(!contains(a.content.content(), "P.S."));
    }
    {
        Fixture f(9);
        auto ctx = f.ctx();
        ctx.opt.afterword_meta_odds = 1;

        const std::vector<nb::SectionId> pool = {11, 22, 33};
        size_t next = 0;
        nb::Section a = nb::render_afterword(ctx, [&] { return pool[next++ % pool.size()]; });
        const std::string& c = a.content.content();
        assert(contains(c, "P.S. your lucky section numbers are #11, #22"));
        assert(contains(c, ", and #"));
        assert(next >= 3 && next < 16);

        std::vector<uint64_t> refs;
        find_hash_refs(c, refs);
        for (uint64_t r : refs) assert(r == a.id || r == 11 || r == 22 || r == 33);

        for (nb::WordId w : a.content.words()) assert(f.glossary.contains(w));
    }
}

static void test_fixed_sections() {
    Fixture f(10);
    auto ctx = f.ctx();

    nb::Section d = nb::render_dedication(ctx);
    assert(contains(d.content.content(), "higher than this one (#" + std::to_string(d.id) + ")."));

    nb::Section fw = nb::render_fourword(ctx);
    assert(fw.word_count() == 5);
    assert(fw.content.content().back() == '.');

    nb::Section ch = nb::render_chapter_1(ctx);
    assert(ch.kind == nb::SectionKind::Chapter1);
    assert(contains(ch.content.content(), "## Chapter 1 (#"));

    for (const nb::Section* s : {&d, &fw, &ch}) {
        for (nb::WordId w : s->content.words()) assert(f.glossary.contains(w));
    }
    assert(d.id != fw.id && fw.id != ch.id && d.id != ch.id);
}

} // namespace

int main() {
    test_index();
    test_table_of_contents();
    test_glossary_completeness();
    test_glossary_undefined_word();
    test_glossary_sentinel();
    test_list_of_figures();
    test_afterword();
    test_fixed_sections();

    std::cout << "OK\n";
    return 0;
}
