// cpp/include/nb/registry.h
#pragma once
#include <cstddef>
#include <deque>

#include "nb/section.h"

namespace nb {

class Rng;

// Ordered sections of the book. Only grows, at either end; existing
// entries are never moved relative to each other.
class SectionRegistry {
public:
    using const_iterator = std::deque<Section>::const_iterator;

    void push_front(Section s);
    void push_back(Section s);

    // front for Dedication / Fourword / TableOfContents, back otherwise
    void insert(Section s);

    const_iterator begin() const { return sections_.begin(); }
    const_iterator end() const { return sections_.end(); }

    const Section& at(size_t i) const { return sections_.at(i); }
    size_t size() const { return sections_.size(); }
    bool empty() const { return sections_.empty(); }

    size_t total_word_count() const;

    // id of a uniformly chosen registered section (registry must be non-empty)
    SectionId random_id(Rng& rng) const;

private:
    std::deque<Section> sections_;
};

} // namespace nb
