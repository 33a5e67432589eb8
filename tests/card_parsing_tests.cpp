#include <gtest/gtest.h>

#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"

#include <string>

TEST(CardNameParsingTest, CorrectCardNameParsing) {
    const std::string CardValueNames = "23456789TJQKA";
    const std::string CardSuitNames = "CDHS";

    for (int i = 0; i < 52; ++i) {
        int valueIndex = i / 4;
        int suitIndex = i % 4;
        std::string cardName = { CardValueNames[valueIndex], CardSuitNames[suitIndex] };
        Result<Card> cardResult = getCardFromName(cardName);
        ASSERT_TRUE(cardResult.isValue());
        EXPECT_EQ(getRankNumber(cardResult.getValue().value), valueIndex + 2);
        EXPECT_EQ(cardResult.getValue().suit, CardSuitNames[suitIndex]);
        EXPECT_EQ(getNameFromCard(cardResult.getValue()), cardName);
    }
}

TEST(CardNameParsingTest, FaceCardRanks) {
    EXPECT_EQ(getRankNumber(getCardFromName("TH").getValue().value), 10);
    EXPECT_EQ(getRankNumber(getCardFromName("JH").getValue().value), 11);
    EXPECT_EQ(getRankNumber(getCardFromName("QH").getValue().value), 12);
    EXPECT_EQ(getRankNumber(getCardFromName("KH").getValue().value), 13);
    EXPECT_EQ(getRankNumber(getCardFromName("AH").getValue().value), 14);
}

TEST(CardNameParsingTest, SuitIsStoredVerbatim) {
    Result<Card> cardResult = getCardFromName("9x");
    ASSERT_TRUE(cardResult.isValue());
    EXPECT_EQ(cardResult.getValue().value, Value::Nine);
    EXPECT_EQ(cardResult.getValue().suit, 'x');
}

TEST(CardNameParsingTest, ErrorFromInvalidValue) {
    EXPECT_TRUE(getCardFromName("1H").isError());
    EXPECT_TRUE(getCardFromName("XH").isError());
    EXPECT_TRUE(getCardFromName("aH").isError());
    EXPECT_TRUE(getCardFromName("0S").isError());
}

TEST(CardNameParsingTest, ErrorFromIncorrectLength) {
    EXPECT_TRUE(getCardFromName("").isError());
    EXPECT_TRUE(getCardFromName("A").isError());
    EXPECT_TRUE(getCardFromName("10H").isError());
    EXPECT_TRUE(getCardFromName("AHS").isError());
}

TEST(CardNameParsingTest, ValueCharactersRoundTrip) {
    for (char c : std::string{ "23456789TJQKA" }) {
        Result<Value> valueResult = getValueFromChar(c);
        ASSERT_TRUE(valueResult.isValue());
        EXPECT_EQ(getCharFromValue(valueResult.getValue()), c);
    }
}

TEST(OutcomeTest, ReversedOutcome) {
    EXPECT_EQ(getReversedOutcome(Outcome::FirstWins), Outcome::SecondWins);
    EXPECT_EQ(getReversedOutcome(Outcome::SecondWins), Outcome::FirstWins);
    EXPECT_EQ(getReversedOutcome(Outcome::Tie), Outcome::Tie);
}
