// File: Errors.hpp
// Description: Declares the exception types raised by geometry queries,
//              board lookups, and game file validation.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace strands {

class NotAdjacentError : public std::invalid_argument {
public:
    explicit NotAdjacentError(const std::string& message) : std::invalid_argument(message) {}
};

class OutOfBoundsError : public std::out_of_range {
public:
    explicit OutOfBoundsError(const std::string& message) : std::out_of_range(message) {}
};

class InvalidBoardError : public std::invalid_argument {
public:
    explicit InvalidBoardError(const std::string& message) : std::invalid_argument(message) {}
};

enum class GameErrorKind {
    MissingTheme,
    MissingSeparator,
    EmptyBoard,
    RaggedBoard,
    BadLetter,
    MissingAnswers,
    MalformedAnswer,
    WordTooShort,
    BadStep,
    StartOutOfBounds,
    StrandOutOfBounds,
    WordMismatch,
    UncoveredCells
};

// lineNumber is 1-based; 0 when the failure is not tied to a single line.
class InvalidGameError : public std::invalid_argument {
public:
    InvalidGameError(GameErrorKind kind, std::size_t lineNumber, const std::string& message);

    GameErrorKind kind() const noexcept;
    std::size_t lineNumber() const noexcept;

private:
    GameErrorKind m_kind;
    std::size_t m_lineNumber;
};

const char* gameErrorKindName(GameErrorKind kind) noexcept;

}  // namespace strands
