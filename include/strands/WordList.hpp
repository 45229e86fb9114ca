// File: WordList.hpp
// Description: Declares the dictionary abstraction consulted for non-theme
//              words, plus an in-memory implementation.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace strands {

class WordList {
public:
    virtual ~WordList() = default;

    // `word` is lowercase.
    virtual bool contains(const std::string& word) const = 0;
};

class SetWordList : public WordList {
public:
    SetWordList() = default;

    // One word per line; surrounding whitespace is trimmed, blank lines are
    // skipped, and words are stored lowercase.
    explicit SetWordList(const std::vector<std::string>& lines);

    bool contains(const std::string& word) const override;

    void add(const std::string& word);
    std::size_t size() const noexcept;

private:
    std::unordered_set<std::string> m_words;
};

// Throws std::runtime_error if the file cannot be opened.
std::unique_ptr<WordList> loadWordListFile(const std::string& path);

}  // namespace strands
