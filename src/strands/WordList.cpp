// File: WordList.cpp
// Description: Implements the in-memory dictionary and its file loader.

#include "strands/WordList.hpp"

#include "strands/Logger.hpp"
#include "strands/TextUtil.hpp"

namespace strands {

SetWordList::SetWordList(const std::vector<std::string>& lines) {
    m_words.reserve(lines.size());
    for (const std::string& line : lines) {
        add(line);
    }
}

bool SetWordList::contains(const std::string& word) const {
    return m_words.find(word) != m_words.end();
}

void SetWordList::add(const std::string& word) {
    const std::string entry = toLowerCopy(trim(word));
    if (!entry.empty()) {
        m_words.insert(entry);
    }
}

std::size_t SetWordList::size() const noexcept {
    return m_words.size();
}

std::unique_ptr<WordList> loadWordListFile(const std::string& path) {
    auto words = std::make_unique<SetWordList>(readLines(path));
    Logger::instance().log(LogLevel::Info,
                           "Loaded " + std::to_string(words->size()) + " dictionary words from " +
                               path + ".");
    return words;
}

}  // namespace strands
