// Tests for listops::join / listops::split
// Compile with: g++ -std=c++17 -I../include -o strings_test strings_test.cpp

#include <listops/strings.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace listops;

using Strings = std::vector<std::string>;

void test_join() {
    std::cout << "Testing join..." << std::endl;

    Strings words = {"alpha", "beta", "gamma"};
    assert(join(words) == "alpha,beta,gamma");
    assert(join(words, WHITE_SPACE_DELIMITER) == "alpha beta gamma");
    assert(join(words, " :: ") == "alpha :: beta :: gamma");

    Strings single = {"only"};
    assert(join(single) == "only");

    // Empty elements are kept in place
    Strings with_blank = {"a", "", "b"};
    assert(join(with_blank) == "a,,b");

    std::cout << "✓ Join tests passed" << std::endl;
}

void test_join_empty_inputs() {
    std::cout << "Testing join with empty inputs..." << std::endl;

    Strings none_at_all;
    Strings words = {"a", "b"};
    assert(join(none_at_all) == "");
    assert(join(none_at_all, ";") == "");
    assert(join(words, "") == "");
    assert(join(Option<const Strings&>(None)) == "");
    assert(join(Option<const Strings&>(words), "-") == "a-b");

    std::cout << "✓ Join empty input tests passed" << std::endl;
}

void test_split() {
    std::cout << "Testing split..." << std::endl;

    assert(split("a,b,c") == Strings({"a", "b", "c"}));
    assert(split("a b c", WHITE_SPACE_DELIMITER) == Strings({"a", "b", "c"}));
    assert(split("no-delimiter") == Strings({"no-delimiter"}));

    // The delimiter is literal, not a pattern
    assert(split("1.2.3", ".") == Strings({"1", "2", "3"}));
    assert(split("a|b", "|") == Strings({"a", "b"}));
    assert(split("x[*]y[*]z", "[*]") == Strings({"x", "y", "z"}));

    std::cout << "✓ Split tests passed" << std::endl;
}

void test_split_edge_cases() {
    std::cout << "Testing split edge cases..." << std::endl;

    assert(split("").empty());
    assert(split("a,b", "").empty());
    assert(split(Option<const std::string&>(None)).empty());

    // Leading empties are kept, trailing empties are dropped
    assert(split(",a") == Strings({"", "a"}));
    assert(split("a,,b") == Strings({"a", "", "b"}));
    assert(split("a,,b,,") == Strings({"a", "", "b"}));
    assert(split(",").empty());
    assert(split(",,,").empty());

    std::string source = "k=v";
    assert(split(Option<const std::string&>(source), "=") == Strings({"k", "v"}));

    std::cout << "✓ Split edge case tests passed" << std::endl;
}

void test_null_c_strings() {
    std::cout << "Testing null C string arguments..." << std::endl;

    const char* absent = nullptr;
    Strings words = {"a", "b"};

    assert(join(words, absent) == "");
    assert(join(Option<const Strings&>(words), absent) == "");
    assert(split(absent).empty());
    assert(split(absent, ";").empty());
    assert(split("a,b", absent).empty());
    assert(split(std::string("a,b"), absent).empty());
    assert(split(absent, std::string(",")).empty());

    std::string source = "a,b";
    assert(split(Option<const std::string&>(source), absent).empty());

    std::cout << "✓ Null C string tests passed" << std::endl;
}

void test_split_join_round_trip() {
    std::cout << "Testing split/join round trip..." << std::endl;

    Strings words = {"north", "east", "south", "west"};
    for (const char* delimiter : {",", " ", "--", "<>"}) {
        assert(split(join(words, delimiter), delimiter) == words);
    }

    std::cout << "✓ Round trip tests passed" << std::endl;
}

int main() {
    std::cout << "Running listops string tests..." << std::endl;
    std::cout << "================================" << std::endl;

    test_join();
    test_join_empty_inputs();
    test_split();
    test_split_edge_cases();
    test_null_c_strings();
    test_split_join_round_trip();

    std::cout << "================================" << std::endl;
    std::cout << "✅ All string tests passed!" << std::endl;

    return 0;
}
