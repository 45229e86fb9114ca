// File: word_list_tests.cpp
// Description: Tests for the in-memory dictionary.

#include "TestSupport.hpp"

#include "strands/WordList.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

static int test_lines_are_normalized() {
    const strands::SetWordList words({"  Fort ", "wort", "", "   ", "TROW\r"});
    EXPECT(words.size() == 3, "blank lines are skipped");
    EXPECT(words.contains("fort"), "trimmed and lowercased");
    EXPECT(words.contains("trow"), "carriage return trimmed");
    EXPECT(!words.contains("Fort"), "lookups expect lowercase words");
    EXPECT(!words.contains("forty"), "unknown word");
    return 0;
}

static int test_add_ignores_duplicates() {
    strands::SetWordList words;
    words.add("tort");
    words.add("TORT");
    EXPECT(words.size() == 1, "same word twice");
    EXPECT(words.contains("tort"), "added word is found");
    return 0;
}

static int test_load_file() {
    const std::string path = "word_list_tests_words.txt";
    {
        std::ofstream out(path);
        out << "fort\nwort\n\ntrow\n";
    }
    const std::unique_ptr<strands::WordList> words = strands::loadWordListFile(path);
    std::remove(path.c_str());
    EXPECT(words->contains("wort"), "file words are loaded");
    EXPECT(!words->contains(""), "blank line is not a word");

    EXPECT_THROWS(strands::loadWordListFile("does/not/exist.txt"),
                  std::runtime_error,
                  "missing files are reported");
    return 0;
}

int main() {
    testing_support::quietLogger();
    int failures = 0;
    RUN_TEST(test_lines_are_normalized);
    RUN_TEST(test_add_ignores_duplicates);
    RUN_TEST(test_load_file);
    return failures == 0 ? 0 : 1;
}
