// File: Strand.hpp
// Description: Declares strands, paths of adjacent cells described by a start
//              position and a sequence of steps.

#pragma once

#include "strands/Geometry.hpp"

#include <cstddef>
#include <iosfwd>
#include <set>
#include <vector>

namespace strands {

class Strand {
public:
    Strand() = default;
    Strand(Position start, std::vector<Step> steps);

    // Rebuilds the steps between consecutive cells of `path`. Throws
    // NotAdjacentError when two consecutive cells are not neighbors and
    // std::invalid_argument when `path` is empty.
    static Strand fromPath(const std::vector<Position>& path);

    Position getStart() const noexcept;
    const std::vector<Step>& getSteps() const noexcept;
    std::size_t length() const noexcept;

    // The start followed by every position reached by the steps, assuming an
    // unbounded board.
    std::vector<Position> positions() const;
    std::set<Position> positionSet() const;
    Position endPosition() const noexcept;

    bool isCyclic() const;
    bool isFolded() const;

    Strand reversed() const;

private:
    Position m_start;
    std::vector<Step> m_steps;
};

bool operator==(const Strand& lhs, const Strand& rhs) noexcept;
bool operator!=(const Strand& lhs, const Strand& rhs) noexcept;
std::ostream& operator<<(std::ostream& out, const Strand& strand);

}  // namespace strands
