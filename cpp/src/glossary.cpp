#include "nb/glossary.h"
#include "nb/errors.h"
#include "nb/validator.h"

#include <sstream>

namespace nb {

bool Glossary::insert(WordId term, Definition def) {
    return entries_.emplace(term, std::move(def)).second;
}

const Glossary::Definition* Glossary::find(WordId term) const {
    auto it = entries_.find(term);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

bool is_random_signal(const AnnotatedText& def) {
    return def.content() == kRandomSignal;
}

Glossary build_glossary(WordInterner& interner, const GlossaryData& data) {
    Glossary g;

    for (const auto& kv : data.defined) {
        const WordId term = interner.intern(kv.first);
        if (!g.insert(term, annotate(interner, kv.second))) {
            throw NbException(ErrorCode::DuplicateEntry, "glossary term '" + kv.first + "' defined twice");
        }
    }
    for (const auto& w : data.undefined) {
        if (!g.insert(interner.intern(w), std::nullopt)) {
            throw NbException(ErrorCode::DuplicateEntry, "glossary term '" + w + "' listed twice");
        }
    }

    auto vr = validate_glossary_closure(g, interner);
    if (!vr.ok) {
        std::ostringstream oss;
        oss << "glossary is not closed:";
        for (const auto& e : vr.errors) oss << "\n  " << e;
        throw NbException(ErrorCode::GlossaryNotClosed, oss.str());
    }
    return g;
}

Glossary build_global_glossary(WordInterner& interner) {
    return build_glossary(interner, default_glossary_data());
}

} // namespace nb
