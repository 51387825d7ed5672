// cpp/tools/nb_validate_main.cpp
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include "nb/book.h"
#include "nb/errors.h"
#include "nb/stats.h"
#include "nb/validator.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

static bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    nb::BookOptions opt = nb::book_options_from_env();

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        uint64_t v = 0;
        if ((a == "--words" || a == "--seed") && parse_u64(arg_value(i, argc, argv), v)) {
            if (a == "--words") opt.word_minimum = (size_t)v;
            else opt.seed = v;
        } else {
            std::cerr << "Usage: nb_validate [--words N] [--seed S]\n";
            return 1;
        }
    }

    nb::ValidationResult vr;
    try {
        auto book = nb::generate_book(opt);
        vr = nb::validate_book(book.sections(), book.glossary(), book.words());
    } catch (const nb::NbException& e) {
        vr.ok = false;
        vr.errors.push_back(std::string("generation failed [") + nb::error_code_name(e.code()) + "]: " + e.what());
    } catch (const std::exception& e) {
        vr.ok = false;
        vr.errors.push_back(std::string("generation failed: ") + e.what());
    }

    std::cout << nb::to_json(vr).dump() << "\n";
    return vr.ok ? 0 : 2;
}
