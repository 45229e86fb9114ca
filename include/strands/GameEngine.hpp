// File: GameEngine.hpp
// Description: Declares the gameplay state machine: strand submission,
//              found-word tracking, and the hint meter.

#pragma once

#include "strands/Board.hpp"
#include "strands/GameLoader.hpp"
#include "strands/Strand.hpp"
#include "strands/WordList.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace strands {

struct GameConfig {
    int hintThreshold{3};
    std::size_t minWordLength{4};
    std::size_t minAnswerLength{kMinAnswerLength};
};

enum class SubmitStatus { Found, FoundDictionary, AlreadyFound, TooShort, NotInWordList };

struct SubmitResult {
    SubmitStatus status{SubmitStatus::NotInWordList};
    std::string word;  // set for Found and FoundDictionary only
};

bool operator==(const SubmitResult& lhs, const SubmitResult& rhs) noexcept;
const char* submitStatusMessage(SubmitStatus status) noexcept;

struct ActiveHint {
    std::size_t index{0};
    bool revealed{false};  // whether the first and last letters are shown
};

bool operator==(const ActiveHint& lhs, const ActiveHint& rhs) noexcept;

enum class HintStatus { Hint, NoHintYet, UseCurrentHint, NoWordsLeft };

struct HintResult {
    HintStatus status{HintStatus::NoHintYet};
    ActiveHint hint;  // meaningful for HintStatus::Hint only
};

bool operator==(const HintResult& lhs, const HintResult& rhs) noexcept;
const char* hintStatusMessage(HintStatus status) noexcept;

class GameEngine {
public:
    // `dictionary` must outlive the engine. Throws std::invalid_argument for a
    // negative hint threshold or a zero minimum word length.
    GameEngine(GameDefinition game, const WordList& dictionary, GameConfig config = {});

    // Parses `lines` with loadGame(); throws InvalidGameError.
    GameEngine(const std::vector<std::string>& lines,
               const WordList& dictionary,
               GameConfig config = {});

    const std::string& theme() const noexcept;
    const Board& board() const noexcept;
    const std::vector<Answer>& answers() const noexcept;

    // Theme strands in the order they were found, as submitted.
    const std::vector<Strand>& foundStrands() const noexcept;
    // Every accepted word, theme or dictionary, in the order found.
    const std::vector<std::string>& foundWords() const noexcept;
    bool isFound(std::size_t answerIndex) const;
    bool gameOver() const noexcept;

    int hintThreshold() const noexcept;
    int hintMeter() const noexcept;
    std::optional<ActiveHint> activeHint() const noexcept;

    // Throws OutOfBoundsError if the strand leaves the board.
    SubmitResult submitStrand(const Strand& strand);
    HintResult useHint();

private:
    GameDefinition m_game;
    const WordList& m_dictionary;
    GameConfig m_config;
    std::vector<std::set<Position>> m_answerCells;
    std::vector<bool> m_answerFound;
    std::vector<Strand> m_foundStrands;
    std::vector<std::string> m_foundWords;
    std::unordered_set<std::string> m_foundWordSet;
    int m_hintMeter{0};
    std::optional<ActiveHint> m_activeHint;

    std::optional<std::size_t> matchAnswer(const std::string& word,
                                           const std::set<Position>& cells) const;
    SubmitResult acceptAnswer(std::size_t index, const Strand& strand);
    void recordWord(const std::string& word);
};

}  // namespace strands
