// File: main.cpp
// Description: Loads a game file and an optional word list, then runs the
//              console frontend.

#include "frontend/ConsoleUI.hpp"
#include "strands/Errors.hpp"
#include "strands/GameEngine.hpp"
#include "strands/GameLoader.hpp"
#include "strands/Logger.hpp"
#include "strands/WordList.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr const char* kDefaultLogFile = "logs/strands.log";

int parseThreshold(const std::string& text, int fallback, const char* source) {
    int value = -1;
    std::size_t consumed = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::invalid_argument&) {
        consumed = 0;
    } catch (const std::out_of_range&) {
        consumed = 0;
    }
    if (consumed != 0 && consumed == text.size() && value >= 0) {
        return value;
    }
    std::cerr << "Invalid hint threshold from " << source << "; using " << fallback << ".\n";
    return fallback;
}

strands::GameConfig resolveConfig(int argc, char* argv[]) {
    strands::GameConfig config;

    if (const char* envThreshold = std::getenv("STRANDS_HINT_THRESHOLD")) {
        config.hintThreshold =
            parseThreshold(envThreshold, config.hintThreshold, "STRANDS_HINT_THRESHOLD");
    }
    if (argc > 3) {
        config.hintThreshold = parseThreshold(argv[3], config.hintThreshold, "the command line");
    }
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <game-file> [word-list-file] [hint-threshold]\n";
        return 2;
    }

    const char* envLogFile = std::getenv("STRANDS_LOG_FILE");
    strands::Logger& logger = strands::Logger::instance();
    logger.setConsoleEcho(false);
    try {
        logger.initialize(envLogFile != nullptr ? envLogFile : kDefaultLogFile);
    } catch (const std::runtime_error& ex) {
        std::cerr << ex.what() << "; continuing without a log file.\n";
    }

    const strands::GameConfig config = resolveConfig(argc, argv);
    logger.log("Hint threshold set to " + std::to_string(config.hintThreshold) + ".");

    try {
        std::unique_ptr<strands::WordList> dictionary;
        if (argc > 2) {
            dictionary = strands::loadWordListFile(argv[2]);
        } else {
            dictionary = std::make_unique<strands::SetWordList>();
        }
        strands::GameEngine engine(
            strands::loadGameFile(argv[1], config.minAnswerLength), *dictionary, config);

        frontend::ConsoleUI ui(engine);
        ui.run();
    } catch (const strands::InvalidGameError& ex) {
        std::cerr << "Invalid game file " << argv[1] << ": " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        logger.log(strands::LogLevel::Error, std::string("Terminated: ") + ex.what());
        std::cerr << "Terminated: " << ex.what() << "\n";
        return 1;
    }

    logger.log("Session finished.");
    return 0;
}
