#include "nb/registry.h"
#include "nb/errors.h"
#include "nb/random.h"

namespace nb {

void SectionRegistry::push_front(Section s) {
    sections_.push_front(std::move(s));
}

void SectionRegistry::push_back(Section s) {
    sections_.push_back(std::move(s));
}

void SectionRegistry::insert(Section s) {
    if (inserted_at_front(s.kind)) push_front(std::move(s));
    else push_back(std::move(s));
}

size_t SectionRegistry::total_word_count() const {
    size_t total = 0;
    for (const auto& s : sections_) total += s.word_count();
    return total;
}

SectionId SectionRegistry::random_id(Rng& rng) const {
    if (sections_.empty()) {
        throw NbException(ErrorCode::InvalidArgs, "random_id on an empty registry");
    }
    return sections_[rng.index(sections_.size())].id;
}

} // namespace nb
