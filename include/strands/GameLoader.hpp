// File: GameLoader.hpp
// Description: Declares parsing of game files into a validated theme, board,
//              and ordered answer list.

#pragma once

#include "strands/Board.hpp"
#include "strands/Strand.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace strands {

constexpr std::size_t kMinAnswerLength = 3;

struct Answer {
    std::string word;
    Strand strand;
};

bool operator==(const Answer& lhs, const Answer& rhs) noexcept;
bool operator!=(const Answer& lhs, const Answer& rhs) noexcept;

struct GameDefinition {
    std::string theme;
    Board board;
    std::vector<Answer> answers;
};

// Expected layout, sections separated by single blank lines:
//
//   <theme>
//
//   <board row: whitespace separated letters>...
//
//   <WORD ROW COL STEP...>...      (ROW and COL are 1-indexed)
//
//   <anything>...                  (ignored)
//
// Surrounding whitespace on each line is ignored and letters, words, and
// step names are case-insensitive. Throws InvalidGameError on the first
// violation; nothing is returned unless the whole game is valid.
GameDefinition loadGame(const std::vector<std::string>& lines,
                        std::size_t minAnswerLength = kMinAnswerLength);

// Throws std::runtime_error if the file cannot be opened.
GameDefinition loadGameFile(const std::string& path,
                            std::size_t minAnswerLength = kMinAnswerLength);

}  // namespace strands
