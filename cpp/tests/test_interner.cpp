// annotated_text.h first: it must compile on its own
#include "nb/annotated_text.h"

#include <cassert>
#include <iostream>
#include <string>

#include "nb/errors.h"
#include "nb/interner.h"
#include "nb/random.h"

static bool throws_code(nb::ErrorCode code, void (*fn)(nb::WordInterner&), nb::WordInterner& w) {
    try {
        fn(w);
    } catch (const nb::NbException& e) {
        return e.code() == code;
    }
    return false;
}

int main() {
    nb::WordInterner words;

    const nb::WordId a = words.intern("word");
    const nb::WordId b = words.intern("you're");
    assert(a != b);
    assert(words.intern("word") == a);
    assert(words.size() == 2);
    assert(words.resolve(a) == "word");
    assert(words.resolve(b) == "you're");
    assert(words.find("word") == a);
    assert(!words.find("missing"));

    // case-insensitive through the tokenizer
    auto t = nb::annotate(words, "Word WORD word, You're!");
    assert(t.word_count() == 4);
    assert(t.words()[0] == a && t.words()[1] == a && t.words()[2] == a);
    assert(t.words()[3] == b);
    assert(t.content() == "Word WORD word, You're!");
    assert(words.size() == 2);

    // retokenizing reproduces the sequence
    auto t2 = nb::annotate(words, t.content());
    assert(t2.words() == t.words());

    auto t3 = nb::annotate(words, "The cat saw the other cat.");
    assert(t3.word_count() == 6);
    assert(t3.words()[0] == t3.words()[3]);
    assert(t3.words()[1] == t3.words()[5]);
    assert(words.resolve(t3.words()[0]) == "the");

    auto empty = nb::annotate(words, "2019 -- (#12)");
    assert(empty.word_count() == 0);

    assert(throws_code(nb::ErrorCode::InvalidWord, [](nb::WordInterner& w) { w.intern("Word"); }, words));
    assert(throws_code(nb::ErrorCode::InvalidWord, [](nb::WordInterner& w) { w.intern(""); }, words));
    assert(throws_code(nb::ErrorCode::InvalidWord, [](nb::WordInterner& w) { w.intern("it'"); }, words));
    assert(throws_code(nb::ErrorCode::InvalidWord, [](nb::WordInterner& w) { w.intern("a b"); }, words));

    nb::Rng rng(1);
    for (int i = 0; i < 100; ++i) {
        const std::string& r = words.pick_random(rng);
        assert(words.find(r).has_value());
    }

    nb::WordInterner none;
    bool threw = false;
    try {
        none.pick_random(rng);
    } catch (const nb::NbException& e) {
        threw = e.code() == nb::ErrorCode::InvalidArgs;
    }
    assert(threw);

    std::cout << "OK\n";
    return 0;
}
