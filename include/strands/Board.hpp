// File: Board.hpp
// Description: Declares the immutable rectangular letter grid of a game.

#pragma once

#include "strands/Geometry.hpp"
#include "strands/Strand.hpp"

#include <string>
#include <vector>

namespace strands {

class Board {
public:
    // Each cell must be a single alphabetical character; uppercase letters are
    // stored lowercase. Throws InvalidBoardError for an empty, ragged, or
    // non-alphabetical grid.
    explicit Board(const std::vector<std::vector<std::string>>& letters);

    int numRows() const noexcept;
    int numCols() const noexcept;
    bool contains(Position pos) const noexcept;

    // Throws OutOfBoundsError outside [0, numRows) x [0, numCols).
    char getLetter(Position pos) const;
    std::string evaluateStrand(const Strand& strand) const;

    const std::vector<std::string>& getRows() const noexcept;

private:
    std::vector<std::string> m_rows;
    int m_numRows{0};
    int m_numCols{0};
};

}  // namespace strands
