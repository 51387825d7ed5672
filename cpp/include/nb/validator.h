// cpp/include/nb/validator.h
#pragma once
#include <string>
#include <vector>

#include "nb/glossary.h"
#include "nb/interner.h"
#include "nb/registry.h"

namespace nb {

struct ValidationResult {
    bool ok{false};
    std::vector<std::string> errors;
};

// Every word of every definition must be a key of g.
ValidationResult validate_glossary_closure(const Glossary& g, const WordInterner& words);

// Referential integrity of a finished (or partial) book:
// - section ids are unique
// - every "#<n>" in any content names a registered section
// - every word of every section is a glossary key
// - each section's word list matches a re-tokenization of its content
ValidationResult validate_book(const SectionRegistry& sections,
                               const Glossary& g,
                               const WordInterner& words);

} // namespace nb
