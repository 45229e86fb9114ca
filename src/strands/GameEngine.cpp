// File: GameEngine.cpp
// Description: Implements submission matching, found-word bookkeeping, and
//              the hint protocol.

#include "strands/GameEngine.hpp"

#include "strands/Logger.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace strands {

bool operator==(const SubmitResult& lhs, const SubmitResult& rhs) noexcept {
    return lhs.status == rhs.status && lhs.word == rhs.word;
}

const char* submitStatusMessage(SubmitStatus status) noexcept {
    switch (status) {
        case SubmitStatus::Found:
            return "Theme word";
        case SubmitStatus::FoundDictionary:
            return "Dictionary word";
        case SubmitStatus::AlreadyFound:
            return "Already found";
        case SubmitStatus::TooShort:
            return "Too short";
        case SubmitStatus::NotInWordList:
            return "Not in word list";
    }
    return "";
}

bool operator==(const ActiveHint& lhs, const ActiveHint& rhs) noexcept {
    return lhs.index == rhs.index && lhs.revealed == rhs.revealed;
}

bool operator==(const HintResult& lhs, const HintResult& rhs) noexcept {
    if (lhs.status != rhs.status) {
        return false;
    }
    return lhs.status != HintStatus::Hint || lhs.hint == rhs.hint;
}

const char* hintStatusMessage(HintStatus status) noexcept {
    switch (status) {
        case HintStatus::Hint:
            return "Hint";
        case HintStatus::NoHintYet:
            return "No hint yet";
        case HintStatus::UseCurrentHint:
            return "Use your current hint";
        case HintStatus::NoWordsLeft:
            return "No words left";
    }
    return "";
}

GameEngine::GameEngine(GameDefinition game, const WordList& dictionary, GameConfig config)
    : m_game(std::move(game)),
      m_dictionary(dictionary),
      m_config(config) {
    if (config.hintThreshold < 0) {
        throw std::invalid_argument("Hint threshold must not be negative.");
    }
    if (config.minWordLength == 0) {
        throw std::invalid_argument("Minimum word length must be positive.");
    }

    m_answerCells.reserve(m_game.answers.size());
    for (const Answer& answer : m_game.answers) {
        m_answerCells.push_back(answer.strand.positionSet());
    }
    m_answerFound.assign(m_game.answers.size(), false);
}

GameEngine::GameEngine(const std::vector<std::string>& lines,
                       const WordList& dictionary,
                       GameConfig config)
    : GameEngine(loadGame(lines, config.minAnswerLength), dictionary, config) {}

const std::string& GameEngine::theme() const noexcept {
    return m_game.theme;
}

const Board& GameEngine::board() const noexcept {
    return m_game.board;
}

const std::vector<Answer>& GameEngine::answers() const noexcept {
    return m_game.answers;
}

const std::vector<Strand>& GameEngine::foundStrands() const noexcept {
    return m_foundStrands;
}

const std::vector<std::string>& GameEngine::foundWords() const noexcept {
    return m_foundWords;
}

bool GameEngine::isFound(std::size_t answerIndex) const {
    if (answerIndex >= m_answerFound.size()) {
        throw std::out_of_range("Answer index " + std::to_string(answerIndex) +
                                " is out of range.");
    }
    return m_answerFound[answerIndex];
}

bool GameEngine::gameOver() const noexcept {
    return m_foundStrands.size() == m_game.answers.size();
}

int GameEngine::hintThreshold() const noexcept {
    return m_config.hintThreshold;
}

int GameEngine::hintMeter() const noexcept {
    return m_hintMeter;
}

std::optional<ActiveHint> GameEngine::activeHint() const noexcept {
    return m_activeHint;
}

SubmitResult GameEngine::submitStrand(const Strand& strand) {
    const std::string word = m_game.board.evaluateStrand(strand);
    const std::set<Position> cells = strand.positionSet();

    if (const auto index = matchAnswer(word, cells)) {
        if (m_answerFound[*index]) {
            Logger::instance().log(LogLevel::Debug, "Theme word \"" + word + "\" resubmitted.");
            return {SubmitStatus::AlreadyFound, {}};
        }
        return acceptAnswer(*index, strand);
    }

    if (word.size() < m_config.minWordLength) {
        return {SubmitStatus::TooShort, {}};
    }
    if (m_foundWordSet.count(word) != 0) {
        return {SubmitStatus::AlreadyFound, {}};
    }
    if (!m_dictionary.contains(word)) {
        Logger::instance().log(LogLevel::Debug, "\"" + word + "\" is not in the word list.");
        return {SubmitStatus::NotInWordList, {}};
    }

    recordWord(word);
    m_hintMeter += 1;
    Logger::instance().log(LogLevel::Debug,
                           "Dictionary word \"" + word + "\" found; hint meter at " +
                               std::to_string(m_hintMeter) + ".");
    return {SubmitStatus::FoundDictionary, word};
}

HintResult GameEngine::useHint() {
    if (m_hintMeter < m_config.hintThreshold) {
        return {HintStatus::NoHintYet, {}};
    }

    if (m_activeHint) {
        if (m_activeHint->revealed) {
            return {HintStatus::UseCurrentHint, *m_activeHint};
        }
        m_activeHint->revealed = true;
        Logger::instance().log(LogLevel::Info,
                               "Revealed ends of hint for answer " +
                                   std::to_string(m_activeHint->index) + ".");
        return {HintStatus::Hint, *m_activeHint};
    }

    const auto next = std::find(m_answerFound.begin(), m_answerFound.end(), false);
    if (next == m_answerFound.end()) {
        return {HintStatus::NoWordsLeft, {}};
    }

    m_activeHint = ActiveHint{static_cast<std::size_t>(next - m_answerFound.begin()), false};
    m_hintMeter -= m_config.hintThreshold;
    Logger::instance().log(LogLevel::Info,
                           "Hint issued for answer " + std::to_string(m_activeHint->index) + ".");
    return {HintStatus::Hint, *m_activeHint};
}

std::optional<std::size_t> GameEngine::matchAnswer(const std::string& word,
                                                   const std::set<Position>& cells) const {
    const std::string reversedWord(word.rbegin(), word.rend());
    for (std::size_t i = 0; i < m_game.answers.size(); ++i) {
        const std::string& answerWord = m_game.answers[i].word;
        if ((answerWord == word || answerWord == reversedWord) && m_answerCells[i] == cells) {
            return i;
        }
    }
    return std::nullopt;
}

SubmitResult GameEngine::acceptAnswer(std::size_t index, const Strand& strand) {
    const std::string& answerWord = m_game.answers[index].word;
    m_answerFound[index] = true;
    m_foundStrands.push_back(strand);
    recordWord(answerWord);

    if (m_activeHint && m_activeHint->index == index) {
        m_activeHint.reset();
        Logger::instance().log(LogLevel::Debug,
                               "Hinted answer " + std::to_string(index) +
                                   " found; hint cleared, hint meter at " +
                                   std::to_string(m_hintMeter) + ".");
    }

    std::ostringstream oss;
    oss << "Theme word \"" << answerWord << "\" found at " << strand << " ("
        << m_foundStrands.size() << "/" << m_game.answers.size() << ").";
    Logger::instance().log(LogLevel::Debug, oss.str());
    if (gameOver()) {
        Logger::instance().log(LogLevel::Info, "All theme words found for \"" + m_game.theme + "\".");
    }
    return {SubmitStatus::Found, answerWord};
}

void GameEngine::recordWord(const std::string& word) {
    if (m_foundWordSet.insert(word).second) {
        m_foundWords.push_back(word);
    }
}

}  // namespace strands
