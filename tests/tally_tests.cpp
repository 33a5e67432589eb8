#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/parse_input.hpp"
#include "game/showdown.hpp"
#include "game/tally.hpp"
#include "util/result.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace {
// Player 1 wins lines 1 and 5, player 2 wins lines 2, 3, and 4, line 6 is a tie
const std::string ExampleInput =
    "AH KH QH JH TH 9C 9D 9S 9H 2C\n"
    "7C 7D 7H 2S 2C 8C 8D 8S 3H 3C\n"
    "\n"
    "AC 2D 3H 4S 5C KH QH JH TH 9H\n"
    "5H 5D 9C 9S 2C 5C 5S 9H 9D 3C\n"
    "   \n"
    "2H 3H 4H 5H 6H 2C 3D 4S 5C 6D\n"
    "AH JD 9C 4S 2C AD JC 9H 4C 2S\n";

Result<WinTally, InputError> evaluateString(const std::string& input, const EvaluationSettings& settings) {
    std::istringstream stream(input);
    return evaluateShowdowns(stream, settings);
}
} // namespace

TEST(TallyTest, AddOutcomeWithEachTiePolicy) {
    WinTally empty;

    EXPECT_EQ(addOutcome(empty, Outcome::FirstWins, TiePolicy::Separate), (WinTally{ .player1Wins = 1 }));
    EXPECT_EQ(addOutcome(empty, Outcome::SecondWins, TiePolicy::Separate), (WinTally{ .player2Wins = 1 }));
    EXPECT_EQ(addOutcome(empty, Outcome::Tie, TiePolicy::Separate), (WinTally{ .ties = 1 }));
    EXPECT_EQ(addOutcome(empty, Outcome::Tie, TiePolicy::CreditPlayer1), (WinTally{ .player1Wins = 1 }));
    EXPECT_EQ(addOutcome(empty, Outcome::Tie, TiePolicy::CreditPlayer2), (WinTally{ .player2Wins = 1 }));
}

TEST(TallyTest, AddOutcomeDoesNotModifyInput) {
    WinTally tally{ .player1Wins = 2, .player2Wins = 3, .ties = 1 };
    WinTally nextTally = addOutcome(tally, Outcome::FirstWins, TiePolicy::Separate);
    EXPECT_EQ(tally.player1Wins, 2);
    EXPECT_EQ(nextTally.player1Wins, 3);
}

TEST(TallyTest, TallyOutcomes) {
    std::vector<Outcome> outcomes = { Outcome::FirstWins, Outcome::Tie, Outcome::SecondWins, Outcome::Tie, Outcome::FirstWins };
    EXPECT_EQ(tallyOutcomes(outcomes, TiePolicy::Separate), (WinTally{ .player1Wins = 2, .player2Wins = 1, .ties = 2 }));
    EXPECT_EQ(tallyOutcomes(outcomes, TiePolicy::CreditPlayer2), (WinTally{ .player1Wins = 2, .player2Wins = 3 }));
    EXPECT_EQ(tallyOutcomes({}, TiePolicy::Separate), WinTally{});
}

TEST(TallyTest, TallyOutcomesContinuesFromStartingTally) {
    WinTally startingTally{ .player1Wins = 1, .ties = 1, .skippedLines = 2 };
    std::vector<Outcome> outcomes = { Outcome::SecondWins, Outcome::Tie };
    EXPECT_EQ(tallyOutcomes(outcomes, TiePolicy::Separate, startingTally), (WinTally{ .player1Wins = 1, .player2Wins = 1, .ties = 2, .skippedLines = 2 }));
}

TEST(TallyTest, TiePolicyNames) {
    for (TiePolicy tiePolicy : { TiePolicy::Separate, TiePolicy::CreditPlayer1, TiePolicy::CreditPlayer2 }) {
        Result<TiePolicy> tiePolicyResult = getTiePolicyFromName(getTiePolicyName(tiePolicy));
        ASSERT_TRUE(tiePolicyResult.isValue());
        EXPECT_EQ(tiePolicyResult.getValue(), tiePolicy);
    }
    EXPECT_TRUE(getTiePolicyFromName("nobody").isError());
}

TEST(ShowdownEvaluationTest, CountsTiesSeparately) {
    auto tallyResult = evaluateString(ExampleInput, EvaluationSettings{});
    ASSERT_TRUE(tallyResult.isValue());
    EXPECT_EQ(tallyResult.getValue(), (WinTally{ .player1Wins = 2, .player2Wins = 3, .ties = 1 }));
}

TEST(ShowdownEvaluationTest, CreditPlayer2MatchesOriginalTotals) {
    EvaluationSettings settings{ .tiePolicy = TiePolicy::CreditPlayer2 };
    auto tallyResult = evaluateString(ExampleInput, settings);
    ASSERT_TRUE(tallyResult.isValue());
    EXPECT_EQ(tallyResult.getValue(), (WinTally{ .player1Wins = 2, .player2Wins = 4 }));
}

TEST(ShowdownEvaluationTest, EmptyInput) {
    auto tallyResult = evaluateString("", EvaluationSettings{});
    ASSERT_TRUE(tallyResult.isValue());
    EXPECT_EQ(tallyResult.getValue(), WinTally{});
}

TEST(ShowdownEvaluationTest, MalformedLineAbortsByDefault) {
    std::string input = ExampleInput + "AH KH QH JH TH 9C 9D 9S 9H\n" + "AH KH QH JH TH 9C 9D 9S 9H 2C\n";
    auto tallyResult = evaluateString(input, EvaluationSettings{});
    ASSERT_TRUE(tallyResult.isError());
    EXPECT_EQ(tallyResult.getError().type, InputErrorType::MalformedLine);
    EXPECT_EQ(tallyResult.getError().lineNumber, 9);
}

TEST(ShowdownEvaluationTest, InvalidCardAbortsByDefault) {
    auto tallyResult = evaluateString("AH KH QH JH ZZ 9C 9D 9S 9H 2C\n", EvaluationSettings{});
    ASSERT_TRUE(tallyResult.isError());
    EXPECT_EQ(tallyResult.getError().type, InputErrorType::InvalidCardCode);
    EXPECT_EQ(tallyResult.getError().lineNumber, 1);
}

TEST(ShowdownEvaluationTest, SkipPolicyContinuesAfterBadLines) {
    std::string input = "AH KH QH JH TH 9C 9D 9S 9H\n" + ExampleInput + "AH KH QH JH 1H 9C 9D 9S 9H 2C\n";
    EvaluationSettings settings{ .malformedLinePolicy = MalformedLinePolicy::Skip };
    auto tallyResult = evaluateString(input, settings);
    ASSERT_TRUE(tallyResult.isValue());
    EXPECT_EQ(tallyResult.getValue(), (WinTally{ .player1Wins = 2, .player2Wins = 3, .ties = 1, .skippedLines = 2 }));
}

TEST(ShowdownEvaluationTest, ThreadCountDoesNotChangeTotals) {
    std::string input;
    for (int i = 0; i < 200; ++i) {
        input += ExampleInput;
    }

    EvaluationSettings singleThreaded{ .numThreads = 1 };
    EvaluationSettings multiThreaded{ .numThreads = 4 };

    auto singleResult = evaluateString(input, singleThreaded);
    auto multiResult = evaluateString(input, multiThreaded);
    ASSERT_TRUE(singleResult.isValue());
    ASSERT_TRUE(multiResult.isValue());
    EXPECT_EQ(singleResult.getValue(), (WinTally{ .player1Wins = 400, .player2Wins = 600, .ties = 200 }));
    EXPECT_EQ(multiResult.getValue(), singleResult.getValue());
}

TEST(ShowdownEvaluationTest, BatchSizeDoesNotChangeTotals) {
    std::string input = ExampleInput + ExampleInput + ExampleInput;
    WinTally expected{ .player1Wins = 6, .player2Wins = 9, .ties = 3 };

    for (int batchSize : { 1, 2, 5, 6, 7, 1000 }) {
        EvaluationSettings settings{ .numThreads = 2, .batchSize = batchSize };
        auto tallyResult = evaluateString(input, settings);
        ASSERT_TRUE(tallyResult.isValue()) << batchSize;
        EXPECT_EQ(tallyResult.getValue(), expected) << batchSize;
    }
}

TEST(ShowdownEvaluationTest, BatchedTallyKeepsTiePolicyAndSkippedLines) {
    std::string input = ExampleInput + "AH KH QH JH TH 9C\n" + ExampleInput;
    EvaluationSettings settings{ .tiePolicy = TiePolicy::CreditPlayer1, .malformedLinePolicy = MalformedLinePolicy::Skip, .batchSize = 2 };
    auto tallyResult = evaluateString(input, settings);
    ASSERT_TRUE(tallyResult.isValue());
    EXPECT_EQ(tallyResult.getValue(), (WinTally{ .player1Wins = 6, .player2Wins = 6, .skippedLines = 1 }));
}

TEST(ShowdownEvaluationTest, MalformedLineAfterFullBatchesStillAborts) {
    std::string input = ExampleInput + ExampleInput + "AH KH QH\n";
    EvaluationSettings settings{ .batchSize = 3 };
    auto tallyResult = evaluateString(input, settings);
    ASSERT_TRUE(tallyResult.isError());
    EXPECT_EQ(tallyResult.getError().type, InputErrorType::MalformedLine);
    EXPECT_EQ(tallyResult.getError().lineNumber, 17);
}

TEST(ShowdownEvaluationTest, OutcomesKeepInputOrder) {
    std::vector<Showdown> showdowns;
    for (const std::string& line : { "AH KH QH JH TH 9C 9D 9S 9H 2C", "7C 7D 7H 2S 2C 8C 8D 8S 3H 3C", "AH JD 9C 4S 2C AD JC 9H 4C 2S" }) {
        showdowns.push_back(*parseShowdownLine(line).getValue());
    }

    std::vector<Outcome> outcomes = evaluateShowdownOutcomes(showdowns, 2);
    EXPECT_EQ(outcomes, (std::vector<Outcome>{ Outcome::FirstWins, Outcome::SecondWins, Outcome::Tie }));
}

TEST(ShowdownEvaluationTest, MalformedLinePolicyNames) {
    EXPECT_EQ(getMalformedLinePolicyFromName("abort").getValue(), MalformedLinePolicy::Abort);
    EXPECT_EQ(getMalformedLinePolicyFromName("skip").getValue(), MalformedLinePolicy::Skip);
    EXPECT_TRUE(getMalformedLinePolicyFromName("ignore").isError());
}
