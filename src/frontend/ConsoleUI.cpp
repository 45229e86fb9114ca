// File: ConsoleUI.cpp
// Description: Implements the console renderer and command handling loop.

#include "frontend/ConsoleUI.hpp"

#include "strands/Errors.hpp"
#include "strands/Logger.hpp"
#include "strands/TextUtil.hpp"

#include <cctype>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace frontend {

ConsoleUI::ConsoleUI(strands::GameEngine& engine, std::istream& input, std::ostream& output)
    : m_engine(engine),
      m_input(input),
      m_output(output) {}

void ConsoleUI::run() {
    m_output << "=== " << m_engine.theme() << " ===\n";
    m_output << "Enter ROW COL STEP... (e.g. 1 4 w w w), HINT, or Q to quit.\n";

    while (!m_engine.gameOver()) {
        render();

        m_output << "> ";
        std::string line;
        if (!std::getline(m_input, line)) {
            break;
        }
        const std::string command = strands::toLowerCopy(strands::trim(line));
        if (command.empty()) {
            continue;
        }
        if (command == "q") {
            m_output << "Goodbye.\n";
            strands::Logger::instance().log("Player quit.");
            return;
        }
        if (command == "hint") {
            handleHint();
            continue;
        }

        const std::optional<strands::Strand> strand = parseStrand(command);
        if (!strand) {
            m_output << "Could not read that strand; use ROW COL STEP...\n";
            continue;
        }
        handleStrand(*strand);
    }

    render();
    if (m_engine.gameOver()) {
        m_output << "All " << m_engine.answers().size() << " theme words found!\n";
    }
}

std::optional<strands::Strand> ConsoleUI::parseStrand(const std::string& line) {
    const std::vector<std::string> tokens = strands::splitWhitespace(line);
    if (tokens.size() < 2) {
        return std::nullopt;
    }

    int row = 0;
    int col = 0;
    try {
        std::size_t consumedRow = 0;
        std::size_t consumedCol = 0;
        row = std::stoi(tokens[0], &consumedRow);
        col = std::stoi(tokens[1], &consumedCol);
        if (consumedRow != tokens[0].size() || consumedCol != tokens[1].size()) {
            return std::nullopt;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    // Every reachable cell must fit in an int.
    const long maxStart = static_cast<long>(std::numeric_limits<int>::max()) -
                          static_cast<long>(tokens.size());
    if (row < 1 || col < 1 || row > maxStart || col > maxStart) {
        return std::nullopt;
    }

    std::vector<strands::Step> steps;
    for (std::size_t i = 2; i < tokens.size(); ++i) {
        const std::optional<strands::Step> step = strands::parseStep(tokens[i]);
        if (!step) {
            return std::nullopt;
        }
        steps.push_back(*step);
    }
    return strands::Strand(strands::Position{row - 1, col - 1}, std::move(steps));
}

void ConsoleUI::render() const {
    const strands::Board& board = m_engine.board();

    std::set<strands::Position> foundCells;
    for (const strands::Strand& strand : m_engine.foundStrands()) {
        const std::set<strands::Position> cells = strand.positionSet();
        foundCells.insert(cells.begin(), cells.end());
    }

    std::set<strands::Position> hintCells;
    strands::Position hintStart;
    strands::Position hintEnd;
    const std::optional<strands::ActiveHint> hint = m_engine.activeHint();
    if (hint) {
        const strands::Strand& strand = m_engine.answers()[hint->index].strand;
        hintCells = strand.positionSet();
        hintStart = strand.getStart();
        hintEnd = strand.endPosition();
    }

    m_output << "\n";
    for (int r = 0; r < board.numRows(); ++r) {
        for (int c = 0; c < board.numCols(); ++c) {
            const strands::Position pos{r, c};
            char letter = board.getLetter(pos);
            char marker = ' ';
            if (foundCells.count(pos) != 0) {
                letter = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
            } else if (hint && hint->revealed && (pos == hintStart || pos == hintEnd)) {
                marker = pos == hintStart ? '<' : '>';
            } else if (hintCells.count(pos) != 0) {
                marker = '+';
            }
            m_output << letter << marker << ' ';
        }
        m_output << "\n";
    }

    m_output << "Theme words: " << m_engine.foundStrands().size() << "/"
             << m_engine.answers().size() << "  Hint meter: " << m_engine.hintMeter() << "/"
             << m_engine.hintThreshold() << "\n";
}

void ConsoleUI::handleHint() {
    const strands::HintResult result = m_engine.useHint();
    if (result.status != strands::HintStatus::Hint) {
        m_output << strands::hintStatusMessage(result.status) << "\n";
        return;
    }
    if (result.hint.revealed) {
        m_output << "Hint: first and last letters marked with < and >.\n";
    } else {
        m_output << "Hint: the cells of a theme word are marked with +.\n";
    }
}

void ConsoleUI::handleStrand(const strands::Strand& strand) {
    try {
        const strands::SubmitResult result = m_engine.submitStrand(strand);
        switch (result.status) {
            case strands::SubmitStatus::Found:
                m_output << "Theme word: " << result.word << "\n";
                break;
            case strands::SubmitStatus::FoundDictionary:
                m_output << "Word: " << result.word << "\n";
                break;
            default:
                m_output << strands::submitStatusMessage(result.status) << "\n";
                break;
        }
    } catch (const strands::OutOfBoundsError& ex) {
        strands::Logger::instance().log(strands::LogLevel::Debug, ex.what());
        m_output << "That strand leaves the board.\n";
    }
}

}  // namespace frontend
