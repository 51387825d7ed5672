#include "nb/section_id.h"
#include "nb/errors.h"
#include "nb/random.h"

#include <limits>

namespace nb {

SectionId allocate_section_id(std::set<SectionId>& used, Rng& rng) {
    constexpr uint64_t kSpace = (uint64_t)std::numeric_limits<SectionId>::max() + 1;

    for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
        const SectionId id = (SectionId)(rng.next_u64() % kSpace);
        if (used.insert(id).second) return id;
    }
    throw NbException(ErrorCode::IdSpaceExhausted,
                      "no free section id after " + std::to_string(kMaxIdAttempts) +
                      " attempts (" + std::to_string(used.size()) + " ids in use)");
}

} // namespace nb
