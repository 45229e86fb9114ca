// File: Geometry.hpp
// Description: Declares board-agnostic grid positions and the eight-neighbor
//              step vocabulary used to describe strands.

#pragma once

#include <array>
#include <iosfwd>
#include <optional>
#include <string>

namespace strands {

// Row 0 is the top row and column 0 the leftmost column. Positions are not
// tied to any board and may be negative.
struct Position {
    int row{0};
    int col{0};
};

bool operator==(const Position& lhs, const Position& rhs) noexcept;
bool operator!=(const Position& lhs, const Position& rhs) noexcept;
bool operator<(const Position& lhs, const Position& rhs) noexcept;
std::ostream& operator<<(std::ostream& out, const Position& pos);

enum class Step { N, S, E, W, NW, NE, SW, SE };

constexpr std::array<Step, 8> kAllSteps{
    Step::N, Step::S, Step::E, Step::W, Step::NW, Step::NE, Step::SW, Step::SE};

struct StepDelta {
    int dRow;
    int dCol;
};

StepDelta stepDelta(Step step) noexcept;

Position takeStep(Position pos, Step step) noexcept;

// Throws NotAdjacentError unless `to` is exactly one king move from `from`.
Step stepTo(Position from, Position to);

bool isAdjacentTo(Position lhs, Position rhs) noexcept;

// Lowercase file token for the step ("n", "se", ...).
const char* stepName(Step step) noexcept;

// Case-insensitive; std::nullopt for anything that is not a direction name.
std::optional<Step> parseStep(const std::string& token);

std::ostream& operator<<(std::ostream& out, Step step);

}  // namespace strands
