// cpp/include/nb/glossary.h
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "nb/annotated_text.h"
#include "nb/interner.h"

namespace nb {

// Definition content meaning "See '<fresh random word>.'" at render time.
constexpr const char* kRandomSignal = "::::";

struct GlossaryData {
    std::vector<std::pair<std::string, std::string>> defined; // term, definition
    std::vector<std::string> undefined;
};

// Closed word -> definition table. Words without a definition are still keys.
class Glossary {
public:
    using Definition = std::optional<AnnotatedText>;

    // false (and no change) if term is already a key
    bool insert(WordId term, Definition def);

    bool contains(WordId term) const { return entries_.find(term) != entries_.end(); }

    // nullptr if term is not a key
    const Definition* find(WordId term) const;

    size_t size() const { return entries_.size(); }

    const std::unordered_map<WordId, Definition>& entries() const { return entries_; }

private:
    std::unordered_map<WordId, Definition> entries_;
};

bool is_random_signal(const AnnotatedText& def);

// Interns every term and definition of data, then checks closure.
// Throws NbException(GlossaryNotClosed) naming the offending words.
Glossary build_glossary(WordInterner& interner, const GlossaryData& data);

// The fixed word lists every book run is built from.
const GlossaryData& default_glossary_data();

Glossary build_global_glossary(WordInterner& interner);

} // namespace nb
