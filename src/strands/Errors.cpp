// File: Errors.cpp
// Description: Implements the game file validation error type.

#include "strands/Errors.hpp"

namespace strands {

namespace {

std::string withLine(std::size_t lineNumber, const std::string& message) {
    if (lineNumber == 0) {
        return message;
    }
    return "line " + std::to_string(lineNumber) + ": " + message;
}

}  // namespace

InvalidGameError::InvalidGameError(GameErrorKind kind,
                                   std::size_t lineNumber,
                                   const std::string& message)
    : std::invalid_argument(withLine(lineNumber, message)),
      m_kind(kind),
      m_lineNumber(lineNumber) {}

GameErrorKind InvalidGameError::kind() const noexcept {
    return m_kind;
}

std::size_t InvalidGameError::lineNumber() const noexcept {
    return m_lineNumber;
}

const char* gameErrorKindName(GameErrorKind kind) noexcept {
    switch (kind) {
        case GameErrorKind::MissingTheme:
            return "missing theme";
        case GameErrorKind::MissingSeparator:
            return "missing separator";
        case GameErrorKind::EmptyBoard:
            return "empty board";
        case GameErrorKind::RaggedBoard:
            return "ragged board";
        case GameErrorKind::BadLetter:
            return "bad letter";
        case GameErrorKind::MissingAnswers:
            return "missing answers";
        case GameErrorKind::MalformedAnswer:
            return "malformed answer";
        case GameErrorKind::WordTooShort:
            return "word too short";
        case GameErrorKind::BadStep:
            return "bad step";
        case GameErrorKind::StartOutOfBounds:
            return "start out of bounds";
        case GameErrorKind::StrandOutOfBounds:
            return "strand out of bounds";
        case GameErrorKind::WordMismatch:
            return "word mismatch";
        case GameErrorKind::UncoveredCells:
            return "uncovered cells";
    }
    return "unknown";
}

}  // namespace strands
