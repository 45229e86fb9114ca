// File: GameLoader.cpp
// Description: Implements the section-by-section game file parser and the
//              answer validation rules.

#include "strands/GameLoader.hpp"

#include "strands/Errors.hpp"
#include "strands/Logger.hpp"
#include "strands/TextUtil.hpp"

#include <cctype>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <utility>

namespace strands {

namespace {

class LineCursor {
public:
    explicit LineCursor(const std::vector<std::string>& lines) : m_lines(lines) {}

    bool atEnd() const noexcept { return m_index >= m_lines.size(); }
    bool atBlank() const { return !atEnd() && trim(m_lines[m_index]).empty(); }
    std::string current() const { return trim(m_lines[m_index]); }
    std::size_t lineNumber() const noexcept { return m_index + 1; }
    void advance() noexcept { ++m_index; }

private:
    const std::vector<std::string>& m_lines;
    std::size_t m_index{0};
};

bool parseInt(const std::string& token, int& value) {
    if (token.empty()) {
        return false;
    }
    std::size_t start = token[0] == '-' || token[0] == '+' ? 1 : 0;
    if (start == token.size()) {
        return false;
    }
    for (std::size_t i = start; i < token.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(token[i])) == 0) {
            return false;
        }
    }
    try {
        value = std::stoi(token);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

void expectSeparator(LineCursor& cursor, GameErrorKind kindAtEnd, const std::string& section) {
    if (cursor.atEnd()) {
        throw InvalidGameError(kindAtEnd, 0, "Game file ends before the " + section + ".");
    }
    if (!cursor.atBlank()) {
        throw InvalidGameError(GameErrorKind::MissingSeparator,
                               cursor.lineNumber(),
                               "Expected a blank line before the " + section + ".");
    }
    cursor.advance();
}

Board parseBoard(LineCursor& cursor) {
    std::vector<std::vector<std::string>> letters;
    while (!cursor.atEnd() && !cursor.atBlank()) {
        std::vector<std::string> row = splitWhitespace(cursor.current());
        for (const std::string& cell : row) {
            if (cell.size() != 1 || std::isalpha(static_cast<unsigned char>(cell[0])) == 0) {
                throw InvalidGameError(GameErrorKind::BadLetter,
                                       cursor.lineNumber(),
                                       "Board cell \"" + cell + "\" is not a single letter.");
            }
        }
        if (!letters.empty() && row.size() != letters.front().size()) {
            throw InvalidGameError(GameErrorKind::RaggedBoard,
                                   cursor.lineNumber(),
                                   "Board row has " + std::to_string(row.size()) +
                                       " letters, expected " +
                                       std::to_string(letters.front().size()) + ".");
        }
        letters.push_back(std::move(row));
        cursor.advance();
    }

    if (letters.empty()) {
        throw InvalidGameError(GameErrorKind::EmptyBoard,
                               cursor.atEnd() ? 0 : cursor.lineNumber(),
                               "Board has no rows.");
    }
    return Board(letters);
}

Answer parseAnswer(const std::vector<std::string>& tokens,
                   const Board& board,
                   std::size_t lineNumber,
                   std::size_t minAnswerLength) {
    if (tokens.size() < 3) {
        throw InvalidGameError(GameErrorKind::MalformedAnswer,
                               lineNumber,
                               "Answer lines take the form WORD ROW COL STEP...");
    }

    const std::string word = toLowerCopy(tokens[0]);
    if (word.size() < minAnswerLength) {
        throw InvalidGameError(GameErrorKind::WordTooShort,
                               lineNumber,
                               "Answer \"" + word + "\" has fewer than " +
                                   std::to_string(minAnswerLength) + " letters.");
    }

    int row = 0;
    int col = 0;
    if (!parseInt(tokens[1], row) || !parseInt(tokens[2], col)) {
        throw InvalidGameError(GameErrorKind::MalformedAnswer,
                               lineNumber,
                               "Answer \"" + word + "\" has a non-numeric start position.");
    }

    std::vector<Step> steps;
    steps.reserve(tokens.size() - 3);
    for (std::size_t i = 3; i < tokens.size(); ++i) {
        const std::optional<Step> step = parseStep(tokens[i]);
        if (!step) {
            throw InvalidGameError(GameErrorKind::BadStep,
                                   lineNumber,
                                   "\"" + tokens[i] + "\" is not a step direction.");
        }
        steps.push_back(*step);
    }

    if (row < 1 || col < 1 || row > board.numRows() || col > board.numCols()) {
        throw InvalidGameError(GameErrorKind::StartOutOfBounds,
                               lineNumber,
                               "Answer \"" + word + "\" starts off the board.");
    }

    const Strand strand(Position{row - 1, col - 1}, std::move(steps));
    for (const Position& pos : strand.positions()) {
        if (!board.contains(pos)) {
            std::ostringstream oss;
            oss << "Answer \"" << word << "\" leaves the board at " << pos << ".";
            throw InvalidGameError(GameErrorKind::StrandOutOfBounds, lineNumber, oss.str());
        }
    }

    const std::string spelled = board.evaluateStrand(strand);
    if (spelled != word) {
        throw InvalidGameError(GameErrorKind::WordMismatch,
                               lineNumber,
                               "Answer \"" + word + "\" spells \"" + spelled + "\" on the board.");
    }

    return Answer{word, strand};
}

void checkCoverage(const Board& board, const std::vector<Answer>& answers) {
    std::set<Position> covered;
    for (const Answer& answer : answers) {
        const std::set<Position> cells = answer.strand.positionSet();
        covered.insert(cells.begin(), cells.end());
    }

    for (int r = 0; r < board.numRows(); ++r) {
        for (int c = 0; c < board.numCols(); ++c) {
            if (covered.find(Position{r, c}) == covered.end()) {
                std::ostringstream oss;
                oss << "Answers do not cover the board; row " << r + 1 << ", column " << c + 1
                    << " is unused.";
                throw InvalidGameError(GameErrorKind::UncoveredCells, 0, oss.str());
            }
        }
    }
}

GameDefinition parseGame(const std::vector<std::string>& lines, std::size_t minAnswerLength) {
    LineCursor cursor(lines);
    while (cursor.atBlank()) {
        cursor.advance();
    }
    if (cursor.atEnd()) {
        throw InvalidGameError(GameErrorKind::MissingTheme, 0, "Game file has no theme.");
    }
    std::string theme = cursor.current();
    cursor.advance();

    expectSeparator(cursor, GameErrorKind::EmptyBoard, "board");
    Board board = parseBoard(cursor);

    expectSeparator(cursor, GameErrorKind::MissingAnswers, "answers");
    std::vector<Answer> answers;
    while (!cursor.atEnd() && !cursor.atBlank()) {
        answers.push_back(parseAnswer(
            splitWhitespace(cursor.current()), board, cursor.lineNumber(), minAnswerLength));
        cursor.advance();
    }
    if (answers.empty()) {
        throw InvalidGameError(GameErrorKind::MissingAnswers,
                               cursor.atEnd() ? 0 : cursor.lineNumber(),
                               "Game file has no answers.");
    }

    checkCoverage(board, answers);
    return GameDefinition{std::move(theme), std::move(board), std::move(answers)};
}

}  // namespace

bool operator==(const Answer& lhs, const Answer& rhs) noexcept {
    return lhs.word == rhs.word && lhs.strand == rhs.strand;
}

bool operator!=(const Answer& lhs, const Answer& rhs) noexcept {
    return !(lhs == rhs);
}

GameDefinition loadGame(const std::vector<std::string>& lines, std::size_t minAnswerLength) {
    try {
        GameDefinition game = parseGame(lines, minAnswerLength);
        Logger::instance().log(LogLevel::Info,
                               "Loaded game \"" + game.theme + "\" (" +
                                   std::to_string(game.board.numRows()) + "x" +
                                   std::to_string(game.board.numCols()) + ", " +
                                   std::to_string(game.answers.size()) + " answers).");
        return game;
    } catch (const InvalidGameError& ex) {
        Logger::instance().log(LogLevel::Warning,
                               std::string("Rejected game file (") + gameErrorKindName(ex.kind()) +
                                   "): " + ex.what());
        throw;
    }
}

GameDefinition loadGameFile(const std::string& path, std::size_t minAnswerLength) {
    return loadGame(readLines(path), minAnswerLength);
}

}  // namespace strands
