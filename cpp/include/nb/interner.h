// cpp/include/nb/interner.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nb {

class Rng;

// Dense handle, ordered by first sight. Valid for the lifetime of the
// interner that issued it.
using WordId = uint32_t;

class WordInterner {
public:
    // s must already be a lowercase word token (see is_lower_word);
    // anything else throws NbException(InvalidWord).
    WordId intern(std::string_view s);

    std::optional<WordId> find(std::string_view s) const;

    const std::string& resolve(WordId id) const;

    // Uniform over every word interned so far.
    const std::string& pick_random(Rng& rng) const;

    size_t size() const { return words_.size(); }

private:
    std::vector<std::string> words_;
    std::unordered_map<std::string, WordId> ids_;
};

} // namespace nb
