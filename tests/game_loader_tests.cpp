// File: game_loader_tests.cpp
// Description: Tests for game file parsing and answer validation.

#include "TestSupport.hpp"

#include "strands/Errors.hpp"
#include "strands/GameLoader.hpp"
#include "strands/TextUtil.hpp"

#include <cstdio>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using strands::Answer;
using strands::GameErrorKind;
using strands::Position;
using strands::Step;
using strands::Strand;

namespace {

const std::vector<Answer>& cs142Answers() {
    static const std::vector<Answer> answers{
        {"cmsc", Strand({0, 3}, {Step::W, Step::W, Step::W})},
        {"one", Strand({1, 0}, {Step::S, Step::E})},
        {"forty", Strand({1, 1}, {Step::E, Step::E, Step::NE, Step::S})},
        {"two", Strand({2, 4}, {Step::W, Step::W})},
    };
    return answers;
}

// Returns the kind of the InvalidGameError raised, or std::nullopt if the
// game loads.
std::optional<GameErrorKind> failureKind(const std::vector<std::string>& lines) {
    try {
        strands::loadGame(lines);
    } catch (const strands::InvalidGameError& ex) {
        return ex.kind();
    }
    return std::nullopt;
}

std::vector<std::string> withAnswers(const std::vector<std::string>& answers) {
    std::vector<std::string> lines{"\"CS 142\"", "", "C S M C T", "O F O R Y", "N E O W T", ""};
    lines.insert(lines.end(), answers.begin(), answers.end());
    return lines;
}

}  // namespace

static int test_load_cs142() {
    const strands::GameDefinition game = strands::loadGame(testing_support::cs142Lines());
    EXPECT(game.theme == "\"CS 142\"", "theme kept verbatim");
    EXPECT(game.board.numRows() == 3, "three rows");
    EXPECT(game.board.numCols() == 5, "five columns");
    EXPECT(game.board.getLetter(Position{0, 4}) == 't', "letters stored lowercase");
    EXPECT(game.answers == cs142Answers(), "answers in file order, 0-indexed");
    return 0;
}

static int test_formatting_variations() {
    const std::vector<std::vector<std::string>> variations{
        {"", "        \"CS 142\"", "", "        C  S  M   C  T", "        O  F  O   R   Y",
         "        N  E  O   W    T", "", "        cmsc 1 4     w  w w",
         "            one 2 1 s     e", "        forty 2 2   e e ne s",
         "         two        3 5  w     w", "        "},
        {"\"CS 142\"", "", "C S M C t", "O f o r y", "N E O W T", "", "Cmsc  1 4 w w w",
         "ONE   2 1 s e", "foRTy 2 2 E E Ne S", "two   3 5 W w"},
        {"\"CS 142\"\r", "\r", "C S M C T\r", "O F O R Y\r", "N E O W T\r", "\r",
         "cmsc 1 4 w w w\r", "one 2 1 s e\r", "forty 2 2 e e ne s\r", "two 3 5 w w\r"},
    };

    for (const std::vector<std::string>& lines : variations) {
        const strands::GameDefinition game = strands::loadGame(lines);
        EXPECT(game.theme == "\"CS 142\"", "theme is trimmed");
        EXPECT(game.board.numCols() == 5, "extra spaces between letters are ignored");
        EXPECT(game.board.getLetter(Position{0, 4}) == 't', "letters stored lowercase");
        EXPECT(game.answers == cs142Answers(), "answers parse the same way");
    }
    return 0;
}

static int test_trailing_notes_are_ignored() {
    std::vector<std::string> lines = testing_support::cs142Lines();
    lines.push_back("");
    lines.push_back("Made for the course, with love.");
    lines.push_back("not 1 1 x");
    const strands::GameDefinition game = strands::loadGame(lines);
    EXPECT(game.answers.size() == 4, "only the answer section is read");
    return 0;
}

static int test_answers_round_trip_through_board() {
    const strands::GameDefinition game = strands::loadGame(testing_support::cs142Lines());
    for (const Answer& answer : game.answers) {
        EXPECT(game.board.evaluateStrand(answer.strand) == answer.word,
               "answer strands spell their words");
    }
    return 0;
}

static int test_folded_answers_are_accepted() {
    // c t
    // o a    "cato" runs c -> a -> t -> o, crossing itself in the middle.
    EXPECT(failureKind({"Folds", "", "c t", "o a", "", "cato 1 1 se n sw"}) == std::nullopt,
           "crossing answer strand loads");
    EXPECT(failureKind({"Folds", "", "c t", "o a", "", "ca 1 1 se"}) ==
               GameErrorKind::WordTooShort,
           "two letter answers are rejected");
    return 0;
}

static int test_structure_errors() {
    EXPECT(failureKind({}) == GameErrorKind::MissingTheme, "empty input");
    EXPECT(failureKind({"", "   "}) == GameErrorKind::MissingTheme, "only blank lines");
    EXPECT(failureKind({"Theme"}) == GameErrorKind::EmptyBoard, "theme only");
    EXPECT(failureKind({"Theme", "a b"}) == GameErrorKind::MissingSeparator,
           "board directly after theme");
    EXPECT(failureKind({"Theme", "", ""}) == GameErrorKind::EmptyBoard, "two blank lines");
    EXPECT(failureKind({"Theme", "", "a b"}) == GameErrorKind::MissingAnswers,
           "no answer section");
    EXPECT(failureKind({"Theme", "", "a b", ""}) == GameErrorKind::MissingAnswers,
           "empty answer section");
    return 0;
}

static int test_board_errors() {
    EXPECT(failureKind({"Theme", "", "a b", "c", "", "abc 1 1 e"}) == GameErrorKind::RaggedBoard,
           "ragged rows");
    EXPECT(failureKind({"Theme", "", "a 1", "", "abc 1 1 e"}) == GameErrorKind::BadLetter,
           "digits are not letters");
    EXPECT(failureKind({"Theme", "", "ab cd", "", "abc 1 1 e"}) == GameErrorKind::BadLetter,
           "multi-letter cells");
    return 0;
}

static int test_answer_errors() {
    const std::string ok[] = {"one   2 1 s e", "forty 2 2 e e ne s", "two   3 5 w w"};
    auto answers = [&](const std::string& first) {
        return withAnswers({first, ok[0], ok[1], ok[2]});
    };

    EXPECT(failureKind(answers("cmsc 1 4 w w w")) == std::nullopt, "baseline loads");
    EXPECT(failureKind(answers("cmsc 1")) == GameErrorKind::MalformedAnswer, "missing column");
    EXPECT(failureKind(answers("cmsc one 4 w w w")) == GameErrorKind::MalformedAnswer,
           "non-numeric row");
    EXPECT(failureKind(answers("cm 1 4 w")) == GameErrorKind::WordTooShort, "two letter word");
    EXPECT(failureKind(answers("cmsc 1 4 w w west")) == GameErrorKind::BadStep, "bad step name");
    EXPECT(failureKind(answers("cmsc 0 4 w w w")) == GameErrorKind::StartOutOfBounds,
           "rows are 1-indexed");
    EXPECT(failureKind(answers("cmsc 1 6 w w w")) == GameErrorKind::StartOutOfBounds,
           "column past the edge");
    EXPECT(failureKind(answers("cmsc -2147483648 4 w w w")) == GameErrorKind::StartOutOfBounds,
           "most negative row");
    EXPECT(failureKind(answers("cmsc 1 -2147483648 w w w")) == GameErrorKind::StartOutOfBounds,
           "most negative column");
    EXPECT(failureKind(answers("cmsc 2147483647 4 w w w")) == GameErrorKind::StartOutOfBounds,
           "largest row");
    EXPECT(failureKind(answers("cmsc 1 4 w w w w")) == GameErrorKind::StrandOutOfBounds,
           "strand walks off the board");
    EXPECT(failureKind(answers("cmsc 1 4 w w s")) == GameErrorKind::WordMismatch,
           "strand spells another word");
    return 0;
}

static int test_uncovered_cells() {
    const std::vector<std::string> lines =
        withAnswers({"cmsc  1 4 w w w", "one   2 1 s e", "forty 2 2 e e ne s"});
    EXPECT(failureKind(lines) == GameErrorKind::UncoveredCells, "answers must fill the board");

    const std::vector<std::string> overlapping = withAnswers(
        {"cmsc  1 4 w w w", "one   2 1 s e", "forty 2 2 e e ne s", "two   3 5 w w", "fort 2 2 e e ne"});
    EXPECT(failureKind(overlapping) == std::nullopt, "overlapping answers are allowed");
    return 0;
}

static int test_error_line_numbers() {
    try {
        strands::loadGame(withAnswers({"cmsc 1 4 w w w", "one 2 1 s s"}));
    } catch (const strands::InvalidGameError& ex) {
        EXPECT(ex.kind() == GameErrorKind::StrandOutOfBounds, "second answer leaves the board");
        EXPECT(ex.lineNumber() == 8, "line number of the bad answer");
        EXPECT(std::string(ex.what()).rfind("line 8:", 0) == 0, "message names the line");
        return 0;
    }
    EXPECT(false, "expected InvalidGameError");
    return 0;
}

static int test_load_game_file() {
    const std::string path = "game_loader_tests_cs142.txt";
    {
        std::ofstream out(path);
        for (const std::string& line : testing_support::cs142Lines()) {
            out << line << '\n';
        }
    }
    const strands::GameDefinition game = strands::loadGameFile(path);
    std::remove(path.c_str());
    EXPECT(game.answers == cs142Answers(), "file loads like lines");

    EXPECT_THROWS(strands::loadGameFile("does/not/exist.txt"),
                  std::runtime_error,
                  "missing files are reported");
    return 0;
}

static int test_load_crlf_file_with_mixed_case_steps() {
    const std::string path = "game_loader_tests_crlf.txt";
    {
        std::ofstream out(path, std::ios::binary);
        out << "\r\n"
            << "   \r\n"
            << "\"CS 142\"\r\n"
            << "\r\n"
            << "C S M C T\r\n"
            << "O F O R Y\r\n"
            << "N E O W T\r\n"
            << "\r\n"
            << "CMSC 1 4 W w W\r\n"
            << "one 2 1 S e\r\n"
            << "forty 2 2 E e NE Se\r\n"
            << "two 3 5 w W\r\n";
    }
    const std::vector<std::string> lines = strands::readLines(path);
    std::remove(path.c_str());

    EXPECT(lines.front() == "\r", "line endings reach the parser");
    const strands::GameDefinition game = strands::loadGame(lines);
    EXPECT(game.theme == "\"CS 142\"", "leading blank lines skipped, carriage return trimmed");
    EXPECT(game.board.getRows().back() == "neowt", "board rows trimmed");
    EXPECT(game.answers == cs142Answers(), "mixed case steps parse");
    return 0;
}

int main() {
    testing_support::quietLogger();
    int failures = 0;
    RUN_TEST(test_load_cs142);
    RUN_TEST(test_formatting_variations);
    RUN_TEST(test_trailing_notes_are_ignored);
    RUN_TEST(test_answers_round_trip_through_board);
    RUN_TEST(test_folded_answers_are_accepted);
    RUN_TEST(test_structure_errors);
    RUN_TEST(test_board_errors);
    RUN_TEST(test_answer_errors);
    RUN_TEST(test_uncovered_cells);
    RUN_TEST(test_error_line_numbers);
    RUN_TEST(test_load_game_file);
    RUN_TEST(test_load_crlf_file_with_mixed_case_steps);
    return failures == 0 ? 0 : 1;
}
