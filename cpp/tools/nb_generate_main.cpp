#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include "nb/book.h"
#include "nb/errors.h"
#include "nb/stats.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

static bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    try {
        out = std::stoull(s);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

static int usage() {
    std::cerr << "Usage: nb_generate [--words N] [--seed S] [--stats]\n";
    return 1;
}

int main(int argc, char** argv) {
    nb::BookOptions opt = nb::book_options_from_env();
    bool stats = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        uint64_t v = 0;
        if (a == "--words") {
            if (!parse_u64(arg_value(i, argc, argv), v)) return usage();
            opt.word_minimum = (size_t)v;
        } else if (a == "--seed") {
            if (!parse_u64(arg_value(i, argc, argv), v)) return usage();
            opt.seed = v;
        } else if (a == "--stats") {
            stats = true;
        } else {
            return usage();
        }
    }

    try {
        auto book = nb::generate_book(opt);
        if (stats) {
            std::cout << nb::to_json(nb::collect_stats(book)).dump() << "\n";
        } else {
            std::cout << nb::render_book_text(book.sections()) << "\n";
        }
        return 0;
    } catch (const nb::NbException& e) {
        std::cerr << "nb_generate failed [" << nb::error_code_name(e.code()) << "]: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "nb_generate failed: " << e.what() << "\n";
        return 2;
    }
}
