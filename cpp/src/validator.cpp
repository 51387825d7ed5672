#include "nb/validator.h"

#include <algorithm>
#include <set>
#include <sstream>

#include "text_common.h"

namespace nb {

namespace {

// Caps repeated messages of one kind per section.
constexpr size_t kMaxErrorsPerSection = 8;

static std::string section_tag(const Section& s) {
    std::ostringstream oss;
    oss << kind_label(s.kind) << " #" << s.id;
    return oss.str();
}

static bool same_tokens(const Section& s, const WordInterner& words, std::string* err) {
    const std::string& content = s.content.content();
    std::vector<TokenSpan> spans;
    find_word_spans(content, spans);

    const auto& have = s.content.words();
    if (spans.size() != have.size()) {
        std::ostringstream oss;
        oss << "word count mismatch: annotated=" << have.size()
            << " retokenized=" << spans.size();
        *err = oss.str();
        return false;
    }

    std::string lowered;
    for (size_t i = 0; i < spans.size(); ++i) {
        to_lower_ascii_to(std::string_view(content).substr(spans[i].start, spans[i].len), lowered);
        auto id = words.find(lowered);
        if (!id || *id != have[i]) {
            *err = "word " + std::to_string(i) + " ('" + lowered + "') does not match its annotation";
            return false;
        }
    }
    return true;
}

} // namespace

ValidationResult validate_glossary_closure(const Glossary& g, const WordInterner& words) {
    ValidationResult vr;
    std::set<WordId> reported;

    // terms in handle order, so the report does not depend on hashing
    std::vector<WordId> terms;
    terms.reserve(g.size());
    for (const auto& kv : g.entries()) terms.push_back(kv.first);
    std::sort(terms.begin(), terms.end());

    for (WordId term : terms) {
        const Glossary::Definition* def = g.find(term);
        if (!def->has_value()) continue;
        for (WordId w : (*def)->words()) {
            if (g.contains(w) || !reported.insert(w).second) continue;
            vr.errors.push_back("'" + words.resolve(w) + "' is used in the definition of '" +
                                words.resolve(term) + "' but is not defined");
        }
    }
    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_book(const SectionRegistry& sections,
                               const Glossary& g,
                               const WordInterner& words) {
    ValidationResult vr;

    std::set<uint64_t> ids;
    for (const auto& s : sections) {
        if (!ids.insert(s.id).second) {
            vr.errors.push_back("duplicate section id #" + std::to_string(s.id));
        }
    }

    std::vector<uint64_t> refs;
    for (const auto& s : sections) {
        const std::string tag = section_tag(s);

        find_hash_refs(s.content.content(), refs);
        size_t bad_refs = 0;
        for (uint64_t r : refs) {
            if (ids.count(r)) continue;
            if (++bad_refs > kMaxErrorsPerSection) break;
            vr.errors.push_back(tag + ": reference to missing section #" + std::to_string(r));
        }

        std::set<WordId> undefined;
        for (WordId w : s.content.words()) {
            if (!g.contains(w)) undefined.insert(w);
        }
        size_t n = 0;
        for (WordId w : undefined) {
            if (++n > kMaxErrorsPerSection) break;
            vr.errors.push_back(tag + ": '" + words.resolve(w) + "' is not defined");
        }

        std::string err;
        if (!same_tokens(s, words, &err)) {
            vr.errors.push_back(tag + ": " + err);
        }
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace nb
