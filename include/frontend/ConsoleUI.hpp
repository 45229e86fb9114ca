// File: ConsoleUI.hpp
// Description: Declares the console-based frontend controller for user I/O.

#pragma once

#include "strands/GameEngine.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace frontend {

class ConsoleUI {
public:
    explicit ConsoleUI(strands::GameEngine& engine,
                       std::istream& input = std::cin,
                       std::ostream& output = std::cout);

    // Returns when the game is over, the player quits, or input ends.
    void run();

    // Parses "ROW COL STEP..." with a 1-indexed start, as in game files.
    static std::optional<strands::Strand> parseStrand(const std::string& line);

private:
    strands::GameEngine& m_engine;
    std::istream& m_input;
    std::ostream& m_output;

    void render() const;
    void handleHint();
    void handleStrand(const strands::Strand& strand);
};

}  // namespace frontend
