#include "game/game_utils.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace {
const std::string CardValueNames = "23456789TJQKA";
} // namespace

Result<Value> getValueFromChar(char c) {
    switch (c) {
        case '2': case '3': case '4': case '5':
        case '6': case '7': case '8': case '9': {
            int valueID = static_cast<int>(Value::Two) + (c - '2');
            return static_cast<Value>(valueID);
        }
        case 'T':
            return Value::Ten;
        case 'J':
            return Value::Jack;
        case 'Q':
            return Value::Queen;
        case 'K':
            return Value::King;
        case 'A':
            return Value::Ace;
        default:
            return "\"" + std::string{ c } + "\" is not a valid card value.";
    }
}

char getCharFromValue(Value value) {
    int index = getRankNumber(value) - static_cast<int>(Value::Two);
    assert(index >= 0 && index < static_cast<int>(CardValueNames.size()));
    return CardValueNames[index];
}

int getRankNumber(Value value) {
    return static_cast<int>(value);
}

Result<Card> getCardFromName(const std::string& cardName) {
    if (cardName.size() != showdown::CardNameLength) {
        return "Error parsing card \"" + cardName + "\": Card codes must be exactly two characters.";
    }

    Result<Value> valueResult = getValueFromChar(cardName[0]);
    if (valueResult.isError()) {
        return "Error parsing card \"" + cardName + "\": " + valueResult.getError();
    }

    return Card{ .value = valueResult.getValue(), .suit = cardName[1] };
}

std::string getNameFromCard(Card card) {
    std::string cardName = { getCharFromValue(card.value), card.suit };
    return cardName;
}

std::vector<std::string> getHandNames(const Hand& hand) {
    std::vector<std::string> cardNames;
    cardNames.reserve(hand.size());
    for (const Card& card : hand) {
        cardNames.push_back(getNameFromCard(card));
    }
    return cardNames;
}

Outcome getReversedOutcome(Outcome outcome) {
    switch (outcome) {
        case Outcome::FirstWins:
            return Outcome::SecondWins;
        case Outcome::SecondWins:
            return Outcome::FirstWins;
        default:
            return Outcome::Tie;
    }
}

std::string getOutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::FirstWins:
            return "Player 1 wins";
        case Outcome::SecondWins:
            return "Player 2 wins";
        case Outcome::Tie:
            return "Tie";
        default:
            assert(false);
            return "";
    }
}
