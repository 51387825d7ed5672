#include "nb/interner.h"
#include "nb/errors.h"
#include "nb/random.h"

#include "text_common.h"

namespace nb {

WordId WordInterner::intern(std::string_view s) {
    if (!is_lower_word(s)) {
        throw NbException(ErrorCode::InvalidWord,
                          "not a lowercase word token: '" + std::string(s) + "'");
    }

    std::string key(s);
    auto it = ids_.find(key);
    if (it != ids_.end()) return it->second;

    const WordId id = (WordId)words_.size();
    words_.push_back(key);
    ids_.emplace(std::move(key), id);
    return id;
}

std::optional<WordId> WordInterner::find(std::string_view s) const {
    auto it = ids_.find(std::string(s));
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const std::string& WordInterner::resolve(WordId id) const {
    if (id >= words_.size()) {
        throw NbException(ErrorCode::InvalidArgs,
                          "word id out of range: " + std::to_string(id));
    }
    return words_[id];
}

const std::string& WordInterner::pick_random(Rng& rng) const {
    if (words_.empty()) {
        throw NbException(ErrorCode::InvalidArgs, "pick_random on an empty interner");
    }
    return words_[rng.index(words_.size())];
}

} // namespace nb
