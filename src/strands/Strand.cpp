// File: Strand.cpp
// Description: Implements strand position derivation together with the
//              cycle and fold checks.

#include "strands/Strand.hpp"

#include <ostream>
#include <stdexcept>
#include <utility>

namespace strands {

namespace {

long cross(const Position& origin, const Position& a, const Position& b) noexcept {
    return static_cast<long>(a.row - origin.row) * (b.col - origin.col) -
           static_cast<long>(a.col - origin.col) * (b.row - origin.row);
}

int sign(long value) noexcept {
    return (value > 0) - (value < 0);
}

// Proper crossing: each segment's endpoints lie strictly on opposite sides
// of the other. Unit lattice edges can only do this as the two diagonals of
// one cell.
bool segmentsCross(const Position& p1,
                   const Position& p2,
                   const Position& q1,
                   const Position& q2) noexcept {
    return sign(cross(q1, q2, p1)) * sign(cross(q1, q2, p2)) < 0 &&
           sign(cross(p1, p2, q1)) * sign(cross(p1, p2, q2)) < 0;
}

bool sameSegment(const Position& p1,
                 const Position& p2,
                 const Position& q1,
                 const Position& q2) noexcept {
    return (p1 == q1 && p2 == q2) || (p1 == q2 && p2 == q1);
}

Step opposite(Step step) noexcept {
    switch (step) {
        case Step::N:
            return Step::S;
        case Step::S:
            return Step::N;
        case Step::E:
            return Step::W;
        case Step::W:
            return Step::E;
        case Step::NW:
            return Step::SE;
        case Step::NE:
            return Step::SW;
        case Step::SW:
            return Step::NE;
        case Step::SE:
            return Step::NW;
    }
    return step;
}

}  // namespace

Strand::Strand(Position start, std::vector<Step> steps)
    : m_start(start),
      m_steps(std::move(steps)) {}

Strand Strand::fromPath(const std::vector<Position>& path) {
    if (path.empty()) {
        throw std::invalid_argument("A strand needs at least one position.");
    }

    std::vector<Step> steps;
    steps.reserve(path.size() - 1);
    for (std::size_t i = 1; i < path.size(); ++i) {
        steps.push_back(stepTo(path[i - 1], path[i]));
    }
    return Strand(path.front(), std::move(steps));
}

Position Strand::getStart() const noexcept {
    return m_start;
}

const std::vector<Step>& Strand::getSteps() const noexcept {
    return m_steps;
}

std::size_t Strand::length() const noexcept {
    return m_steps.size() + 1;
}

std::vector<Position> Strand::positions() const {
    std::vector<Position> result;
    result.reserve(m_steps.size() + 1);
    Position current = m_start;
    result.push_back(current);
    for (const Step step : m_steps) {
        current = takeStep(current, step);
        result.push_back(current);
    }
    return result;
}

std::set<Position> Strand::positionSet() const {
    const std::vector<Position> path = positions();
    return std::set<Position>(path.begin(), path.end());
}

Position Strand::endPosition() const noexcept {
    Position current = m_start;
    for (const Step step : m_steps) {
        current = takeStep(current, step);
    }
    return current;
}

bool Strand::isCyclic() const {
    return positionSet().size() < length();
}

bool Strand::isFolded() const {
    const std::vector<Position> path = positions();
    const std::size_t edgeCount = m_steps.size();

    // Neighbouring edges are never compared. Edges meeting only at a lattice
    // point make the strand cyclic, not folded; a fold needs a crossing or an
    // edge traced twice.
    for (std::size_t i = 0; i < edgeCount; ++i) {
        for (std::size_t j = i + 2; j < edgeCount; ++j) {
            if (sameSegment(path[i], path[i + 1], path[j], path[j + 1]) ||
                segmentsCross(path[i], path[i + 1], path[j], path[j + 1])) {
                return true;
            }
        }
    }
    return false;
}

Strand Strand::reversed() const {
    std::vector<Step> steps;
    steps.reserve(m_steps.size());
    for (auto it = m_steps.rbegin(); it != m_steps.rend(); ++it) {
        steps.push_back(opposite(*it));
    }
    return Strand(endPosition(), std::move(steps));
}

bool operator==(const Strand& lhs, const Strand& rhs) noexcept {
    return lhs.getStart() == rhs.getStart() && lhs.getSteps() == rhs.getSteps();
}

bool operator!=(const Strand& lhs, const Strand& rhs) noexcept {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& out, const Strand& strand) {
    out << strand.getStart();
    for (const Step step : strand.getSteps()) {
        out << ' ' << step;
    }
    return out;
}

}  // namespace strands
