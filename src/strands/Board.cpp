// File: Board.cpp
// Description: Implements board validation, letter lookup, and strand
//              evaluation.

#include "strands/Board.hpp"

#include "strands/Errors.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace strands {

Board::Board(const std::vector<std::vector<std::string>>& letters) {
    if (letters.empty()) {
        throw InvalidBoardError("Board must have at least one row.");
    }

    const std::size_t width = letters.front().size();
    m_rows.reserve(letters.size());
    for (std::size_t r = 0; r < letters.size(); ++r) {
        const std::vector<std::string>& row = letters[r];
        if (row.empty()) {
            throw InvalidBoardError("Board row " + std::to_string(r) + " is empty.");
        }
        if (row.size() != width) {
            throw InvalidBoardError("Board row " + std::to_string(r) + " has " +
                                    std::to_string(row.size()) + " cells, expected " +
                                    std::to_string(width) + ".");
        }

        std::string normalized;
        normalized.reserve(width);
        for (const std::string& cell : row) {
            if (cell.size() != 1 || std::isalpha(static_cast<unsigned char>(cell[0])) == 0) {
                throw InvalidBoardError("Board cell \"" + cell + "\" in row " + std::to_string(r) +
                                        " is not a single letter.");
            }
            normalized.push_back(
                static_cast<char>(std::tolower(static_cast<unsigned char>(cell[0]))));
        }
        m_rows.push_back(std::move(normalized));
    }

    m_numRows = static_cast<int>(m_rows.size());
    m_numCols = static_cast<int>(width);
}

int Board::numRows() const noexcept {
    return m_numRows;
}

int Board::numCols() const noexcept {
    return m_numCols;
}

bool Board::contains(Position pos) const noexcept {
    return pos.row >= 0 && pos.row < m_numRows && pos.col >= 0 && pos.col < m_numCols;
}

char Board::getLetter(Position pos) const {
    if (!contains(pos)) {
        std::ostringstream oss;
        oss << "Position " << pos << " is outside the " << m_numRows << "x" << m_numCols
            << " board.";
        throw OutOfBoundsError(oss.str());
    }
    return m_rows[static_cast<std::size_t>(pos.row)][static_cast<std::size_t>(pos.col)];
}

std::string Board::evaluateStrand(const Strand& strand) const {
    std::string word;
    word.reserve(strand.length());
    for (const Position& pos : strand.positions()) {
        word.push_back(getLetter(pos));
    }
    return word;
}

const std::vector<std::string>& Board::getRows() const noexcept {
    return m_rows;
}

}  // namespace strands
