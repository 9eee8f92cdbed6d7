// Automated tests for filler word removal

#include "filler_filter.hpp"
#include <iostream>
#include <cassert>

using namespace pushscribe;

static bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

void test_russian_fillers() {
    std::cout << "Testing Russian fillers..." << std::endl;
    FillerFilter filter;

    assert(filter.process("Ээ, привет") == "Привет");
    assert(filter.process("Мм, да") == "Да");
    assert(filter.process("ээ, привет") == "Привет");

    std::string result = filter.process("Ээ, ну, хм, это интересно");
    assert(result == "Это интересно");

    assert(filter.process("Это, как бы, вот такая идея") == "Это, такая идея");
    assert(filter.process("Ээ    привет") == "Привет");

    std::cout << "  PASS" << std::endl;
}

void test_english_fillers() {
    std::cout << "Testing English fillers..." << std::endl;
    FillerFilter filter;

    assert(filter.process("Uh, I think so") == "I think so");
    assert(filter.process("Um, yes") == "Yes");
    assert(filter.process("Ummm, yes") == "Yes");
    assert(filter.process("So, like, you know, it's good") == "It's good");
    assert(filter.process("well i mean it works") == "Well it works");

    // Without a comma these are ordinary words
    assert(filter.process("I like it so much") == "I like it so much");

    std::cout << "  PASS" << std::endl;
}

void test_other_languages() {
    std::cout << "Testing German, French and Spanish fillers..." << std::endl;
    FillerFilter filter;

    std::string german = filter.process("Äh, ich denke");
    assert(german == "Ich denke");
    assert(!contains(german, "äh"));
    assert(filter.process("Ähm ja") == "Ja");

    assert(filter.process("euh, je pense") == "Je pense");
    assert(filter.process("bueno, vamos") == "Vamos");

    std::cout << "  PASS" << std::endl;
}

void test_capitalization_scripts() {
    std::cout << "Testing capitalization beyond Latin-1 and Cyrillic..." << std::endl;
    FillerFilter filter;

    assert(filter.process("um, łódź is nice") == "Łódź is nice");
    assert(filter.process("ωραία") == "Ωραία");
    assert(filter.process("ähm, ölçü") == "Ölçü");

    std::cout << "  PASS" << std::endl;
}

void test_punctuation() {
    std::cout << "Testing punctuation handling..." << std::endl;
    FillerFilter filter;

    std::string result = filter.process("Ээ, это хорошо!");
    assert(result == "Это хорошо!");

    // Sentence end moves onto the previous word
    assert(filter.process("I went there, uh. then left") == "I went there. Then left");
    assert(filter.process("go, um.") == "Go.");

    assert(filter.process("Это нормальное предложение.") == "Это нормальное предложение.");

    std::cout << "  PASS" << std::endl;
}

void test_word_classification() {
    std::cout << "Testing single word classification..." << std::endl;
    FillerFilter filter;

    assert(filter.is_filler("uh"));
    assert(filter.is_filler("UHHH"));
    assert(filter.is_filler("эээ"));
    assert(filter.is_filler("хмм"));
    assert(filter.is_filler("ну"));
    assert(filter.is_filler("типа"));

    assert(!filter.is_filler("umbrella"));
    assert(!filter.is_filler("нужно"));
    assert(!filter.is_filler("hello"));
    assert(!filter.is_filler(""));
    // Comma-only fillers are not fillers on their own
    assert(!filter.is_filler("like"));

    std::cout << "  PASS" << std::endl;
}

void test_edge_cases() {
    std::cout << "Testing edge cases..." << std::endl;
    FillerFilter filter;

    assert(filter.process("") == "");
    assert(filter.process("um") == "");
    assert(filter.process("uh, um, эээ") == "");

    std::cout << "  PASS" << std::endl;
}

void test_custom_filler() {
    std::cout << "Testing custom filler words..." << std::endl;
    FillerFilter filter;

    filter.add_filler("test_word");
    std::string result = filter.process("I test_word think so");
    assert(result == "I think so");
    assert(filter.is_filler("TEST_WORD"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Filler Filter Test Suite ===" << std::endl << std::endl;

    test_russian_fillers();
    test_english_fillers();
    test_other_languages();
    test_capitalization_scripts();
    test_punctuation();
    test_word_classification();
    test_edge_cases();
    test_custom_filler();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
