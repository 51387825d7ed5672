#include "nb/stats.h"
#include "nb/errors.h"

#include <map>

namespace nb {

BookStats collect_stats(const BookAssembler& book) {
    BookStats st;
    st.word_minimum = book.options().word_minimum;
    st.total_words = book.sections().total_word_count();
    st.interned_words = book.words().size();
    st.glossary_entries = book.glossary().size();

    for (const auto& s : book.sections()) {
        SectionStat ss;
        ss.kind = kind_label(s.kind);
        ss.id = s.id;
        ss.words = s.word_count();
        ss.bytes = s.content.content().size();
        st.sections.push_back(std::move(ss));
    }
    return st;
}

nlohmann::json to_json(const BookStats& st) {
    nlohmann::json j;
    j["word_minimum"] = st.word_minimum;
    j["total_words"] = st.total_words;
    j["interned_words"] = st.interned_words;
    j["glossary_entries"] = st.glossary_entries;

    std::map<std::string, uint64_t> per_kind;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : st.sections) {
        nlohmann::json e;
        e["kind"] = s.kind;
        e["id"] = s.id;
        e["words"] = s.words;
        e["bytes"] = s.bytes;
        arr.push_back(std::move(e));
        per_kind[s.kind]++;
    }
    j["sections"] = std::move(arr);
    j["section_count"] = st.sections.size();
    j["sections_by_kind"] = per_kind;
    return j;
}

nlohmann::json to_json(const ValidationResult& vr) {
    nlohmann::json j;
    j["ok"] = vr.ok;
    j["code"] = error_code_name(vr.ok ? ErrorCode::Ok : ErrorCode::ValidationFailed);
    j["errors"] = vr.errors;
    return j;
}

} // namespace nb
