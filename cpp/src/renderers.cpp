#include "nb/renderers.h"
#include "nb/errors.h"
#include "nb/random.h"

#include <algorithm>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "text_common.h"

namespace nb {

namespace {

static std::string heading(SectionKind kind, SectionId id) {
    std::ostringstream oss;
    oss << "## " << kind_label(kind) << " (#" << id << ")\n";
    return oss.str();
}

template <class Body>
static Section make_section(RenderContext& ctx, SectionKind kind, Body&& body) {
    Section s;
    s.id = ctx.ids.allocate(ctx.rng);
    s.kind = kind;
    s.content = annotate(ctx.words, body(s.id));
    return s;
}

static const char* kMetaAfterword =
    "Hello, dear reader! I'm the narrator of the text you're reading. Not the author, "
    "but the character they're playing.\n\n"
    "I have a suggestion for you. Go into this book's source code and find the part that "
    "generates this message. What's the probability it would appear? Go on, look. I can wait.\n\n"
    "It's pretty low, isn't it? Do you think the book you're reading just happened to have it? "
    "Or was it chosen on purpose?\n\n"
    "This entire book *could*, in theory, have been generated by the code you can find. "
    "But *was* it?\n\n"
    "Are the section IDs *really* random? What about the fourwords?\n\n"
    "Have fun.\n\n";

} // namespace

Section render_chapter_1(RenderContext& ctx) {
    return make_section(ctx, SectionKind::Chapter1, [](SectionId id) {
        return heading(SectionKind::Chapter1, id) + "\n\\<Insert academia joke here>";
    });
}

Section render_dedication(RenderContext& ctx) {
    return make_section(ctx, SectionKind::Dedication, [](SectionId id) {
        std::ostringstream oss;
        oss << heading(SectionKind::Dedication, id) << "\n"
            << "All material following this dedication is dedicated to the NaNoGenMo 2019 community, "
            << "with the exception of sections with an ID higher than this one (#" << id << ").";
        return oss.str();
    });
}

Section render_fourword(RenderContext& ctx) {
    return make_section(ctx, SectionKind::Fourword, [&](SectionId id) {
        std::string out = heading(SectionKind::Fourword, id) + "\n";
        out += to_title_case(ctx.words.pick_random(ctx.rng));
        for (int i = 0; i < 3; ++i) {
            out += ' ';
            out += ctx.words.pick_random(ctx.rng);
        }
        out += '.';
        return out;
    });
}

Section render_table_of_contents(RenderContext& ctx, const SectionRegistry& sections) {
    return make_section(ctx, SectionKind::TableOfContents, [&](SectionId id) {
        std::ostringstream oss;
        oss << heading(SectionKind::TableOfContents, id);
        for (const auto& s : sections) {
            oss << "\n- **" << kind_label(s.kind) << "** (#" << s.id << ")";
        }
        return oss.str();
    });
}

Section render_glossary(RenderContext& ctx, const Glossary& glossary, const SectionRegistry& sections) {
    std::vector<WordId> words;
    for (const auto& s : sections) {
        words.insert(words.end(), s.content.words().begin(), s.content.words().end());
    }
    std::sort(words.begin(), words.end());
    words.erase(std::unique(words.begin(), words.end()), words.end());

    return make_section(ctx, SectionKind::Glossary, [&](SectionId id) {
        std::string out = heading(SectionKind::Glossary, id);
        for (WordId w : words) {
            const Glossary::Definition* def = glossary.find(w);
            if (!def) {
                throw NbException(ErrorCode::UndefinedWord,
                                  "'" + ctx.words.resolve(w) + "' is not defined");
            }
            if (!def->has_value()) continue;

            out += "\n- **";
            out += ctx.words.resolve(w);
            out += "** - ";
            if (is_random_signal(**def)) {
                out += "See '";
                out += ctx.words.pick_random(ctx.rng);
                out += ".'";
            } else {
                out += (*def)->content();
            }
        }
        return out;
    });
}

Section render_list_of_figures(RenderContext& ctx, SectionId referenced) {
    return make_section(ctx, SectionKind::ListOfFigures, [&](SectionId id) {
        std::ostringstream oss;
        oss << heading(SectionKind::ListOfFigures, id);
        oss << std::fixed << std::setprecision(3);

        const int quantity = ctx.rng.range(ctx.opt.figures_min, ctx.opt.figures_max);
        bool note = false;
        for (int i = 0; i < quantity; ++i) {
            oss << "\n- " << ctx.rng.normal(0.0, ctx.opt.figures_stddev);
            if (ctx.rng.ratio(1, ctx.opt.footnote_odds)) {
                oss << " (*)";
                note = true;
            }
        }
        if (note) {
            oss << "\n\n(*) The accuracy of these numbers is not known. It is recommended not to "
                << "trust them when reading section #" << referenced << ".";
        }
        return oss.str();
    });
}

Section render_index(RenderContext& ctx, const SectionRegistry& sections) {
    std::map<WordId, std::set<SectionId>> uses;
    for (const auto& s : sections) {
        for (WordId w : s.content.words()) uses[w].insert(s.id);
    }

    return make_section(ctx, SectionKind::Index, [&](SectionId id) {
        std::ostringstream oss;
        oss << heading(SectionKind::Index, id);
        for (const auto& kv : uses) {
            oss << "\n- **" << ctx.words.resolve(kv.first) << "** - ";
            bool first = true;
            for (SectionId sid : kv.second) {
                if (!first) oss << ", ";
                oss << "#" << sid;
                first = false;
            }
        }
        return oss.str();
    });
}

Section render_afterword(RenderContext& ctx, const std::function<SectionId()>& pick_section_id) {
    return make_section(ctx, SectionKind::Afterword, [&](SectionId id) {
        std::ostringstream oss;
        oss << heading(SectionKind::Afterword, id) << "\n";

        if (!ctx.rng.ratio(1, ctx.opt.afterword_meta_odds)) {
            oss << to_title_case(ctx.words.pick_random(ctx.rng));
            return oss.str();
        }

        oss << kMetaAfterword;
        const int quantity = ctx.rng.range(3, 16);
        for (int i = 0; i < quantity; ++i) {
            if (i == 0) oss << "P.S. your lucky section numbers are ";
            else if (i == quantity - 1) oss << ", and ";
            else oss << ", ";
            oss << "#" << pick_section_id();
        }
        oss << ".";
        return oss.str();
    });
}

} // namespace nb
