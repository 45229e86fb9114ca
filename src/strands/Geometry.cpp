// File: Geometry.cpp
// Description: Implements position arithmetic and step conversions.

#include "strands/Geometry.hpp"

#include "strands/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ostream>
#include <sstream>

namespace strands {

bool operator==(const Position& lhs, const Position& rhs) noexcept {
    return lhs.row == rhs.row && lhs.col == rhs.col;
}

bool operator!=(const Position& lhs, const Position& rhs) noexcept {
    return !(lhs == rhs);
}

bool operator<(const Position& lhs, const Position& rhs) noexcept {
    if (lhs.row != rhs.row) {
        return lhs.row < rhs.row;
    }
    return lhs.col < rhs.col;
}

std::ostream& operator<<(std::ostream& out, const Position& pos) {
    return out << '(' << pos.row << ", " << pos.col << ')';
}

StepDelta stepDelta(Step step) noexcept {
    switch (step) {
        case Step::N:
            return {-1, 0};
        case Step::S:
            return {1, 0};
        case Step::E:
            return {0, 1};
        case Step::W:
            return {0, -1};
        case Step::NW:
            return {-1, -1};
        case Step::NE:
            return {-1, 1};
        case Step::SW:
            return {1, -1};
        case Step::SE:
            return {1, 1};
    }
    return {0, 0};
}

Position takeStep(Position pos, Step step) noexcept {
    const StepDelta delta = stepDelta(step);
    return {pos.row + delta.dRow, pos.col + delta.dCol};
}

Step stepTo(Position from, Position to) {
    const long dRow = static_cast<long>(to.row) - from.row;
    const long dCol = static_cast<long>(to.col) - from.col;
    if (std::labs(dRow) <= 1 && std::labs(dCol) <= 1) {
        for (const Step step : kAllSteps) {
            const StepDelta delta = stepDelta(step);
            if (delta.dRow == dRow && delta.dCol == dCol) {
                return step;
            }
        }
    }

    std::ostringstream oss;
    oss << "Positions " << from << " and " << to << " are not adjacent.";
    throw NotAdjacentError(oss.str());
}

bool isAdjacentTo(Position lhs, Position rhs) noexcept {
    const long dRow = static_cast<long>(rhs.row) - lhs.row;
    const long dCol = static_cast<long>(rhs.col) - lhs.col;
    return std::labs(dRow) <= 1 && std::labs(dCol) <= 1 && (dRow != 0 || dCol != 0);
}

const char* stepName(Step step) noexcept {
    switch (step) {
        case Step::N:
            return "n";
        case Step::S:
            return "s";
        case Step::E:
            return "e";
        case Step::W:
            return "w";
        case Step::NW:
            return "nw";
        case Step::NE:
            return "ne";
        case Step::SW:
            return "sw";
        case Step::SE:
            return "se";
    }
    return "?";
}

std::optional<Step> parseStep(const std::string& token) {
    std::string lower = token;
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    for (const Step step : kAllSteps) {
        if (lower == stepName(step)) {
            return step;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, Step step) {
    return out << stepName(step);
}

}  // namespace strands
