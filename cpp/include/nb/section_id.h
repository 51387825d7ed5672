// cpp/include/nb/section_id.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <set>

namespace nb {

class Rng;

using SectionId = uint16_t;

// Redraws allowed per allocation before the id space is declared exhausted.
constexpr int kMaxIdAttempts = 4096;

// Draws uniform ids until one is not in used, records it there and returns it.
// Throws NbException(IdSpaceExhausted) after kMaxIdAttempts collisions.
SectionId allocate_section_id(std::set<SectionId>& used, Rng& rng);

class IdAllocator {
public:
    SectionId allocate(Rng& rng) { return allocate_section_id(used_, rng); }

    bool is_used(SectionId id) const { return used_.count(id) != 0; }
    size_t size() const { return used_.size(); }

private:
    std::set<SectionId> used_;
};

} // namespace nb
