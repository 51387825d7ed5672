// cpp/include/nb/stats.h
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "nb/book.h"
#include "nb/validator.h"

namespace nb {

struct SectionStat {
    std::string kind;
    SectionId id{0};
    uint64_t words{0};
    uint64_t bytes{0};
};

struct BookStats {
    uint64_t word_minimum{0};
    uint64_t total_words{0};
    uint64_t interned_words{0};
    uint64_t glossary_entries{0};
    std::vector<SectionStat> sections; // registry order
};

BookStats collect_stats(const BookAssembler& book);

nlohmann::json to_json(const BookStats& st);
nlohmann::json to_json(const ValidationResult& vr);

} // namespace nb
