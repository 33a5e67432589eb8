#include "game/hand_evaluation.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <functional>
#include <string>
#include <vector>

namespace {
bool isFlush(const Hand& hand) {
    Suit suit = hand[0].suit;
    return std::all_of(hand.begin(), hand.end(), [suit](const Card& card) { return card.suit == suit; });
}

// Ace is always high, so A-5-4-3-2 is not a straight
bool isStraight(const Hand& sortedHand) {
    for (int i = 0; i < showdown::HandSize - 1; ++i) {
        if (getRankNumber(sortedHand[i].value) != getRankNumber(sortedHand[i + 1].value) + 1) {
            return false;
        }
    }
    return true;
}

bool hasFrequency(const std::vector<ValueFrequency>& valueFrequencies, int count) {
    return std::any_of(valueFrequencies.begin(), valueFrequencies.end(), [count](const ValueFrequency& frequency) {
        return frequency.count == count;
    });
}

int countFrequency(const std::vector<ValueFrequency>& valueFrequencies, int count) {
    return static_cast<int>(std::count_if(valueFrequencies.begin(), valueFrequencies.end(), [count](const ValueFrequency& frequency) {
        return frequency.count == count;
    }));
}

HandType classifySortedHand(const Hand& sortedHand) {
    std::vector<ValueFrequency> valueFrequencies = getValueFrequencies(sortedHand);

    bool isFlushHand = isFlush(sortedHand);
    bool isStraightHand = isStraight(sortedHand);
    bool isStraightFlush = isFlushHand && isStraightHand;

    if (isStraightFlush && sortedHand[0].value == Value::Ace) {
        return HandType::RoyalFlush;
    }
    else if (isStraightFlush) {
        return HandType::StraightFlush;
    }
    else if (hasFrequency(valueFrequencies, 4)) {
        return HandType::FourOfAKind;
    }
    else if (hasFrequency(valueFrequencies, 3) && hasFrequency(valueFrequencies, 2)) {
        return HandType::FullHouse;
    }
    else if (isFlushHand) {
        return HandType::Flush;
    }
    else if (isStraightHand) {
        return HandType::Straight;
    }
    else if (hasFrequency(valueFrequencies, 3)) {
        return HandType::ThreeOfAKind;
    }
    else if (countFrequency(valueFrequencies, 2) == 2) {
        return HandType::TwoPair;
    }
    else if (hasFrequency(valueFrequencies, 2)) {
        return HandType::Pair;
    }
    else {
        return HandType::HighCard;
    }
}

Outcome compareValues(Value value1, Value value2) {
    if (value1 > value2) {
        return Outcome::FirstWins;
    }
    else if (value1 < value2) {
        return Outcome::SecondWins;
    }
    else {
        return Outcome::Tie;
    }
}

Outcome compareHighCards(const Hand& sortedHand1, const Hand& sortedHand2) {
    for (int i = 0; i < showdown::HandSize; ++i) {
        Outcome outcome = compareValues(sortedHand1[i].value, sortedHand2[i].value);
        if (outcome != Outcome::Tie) {
            return outcome;
        }
    }
    return Outcome::Tie;
}

// Compares the values of the first numGroups value frequencies.
// Both hands have the same hand type, so the groups line up: quads then kicker, trips then pair, high pair then low pair then kicker.
Outcome compareValueGroups(const std::vector<ValueFrequency>& valueFrequencies1, const std::vector<ValueFrequency>& valueFrequencies2, int numGroups) {
    assert(static_cast<int>(valueFrequencies1.size()) >= numGroups);
    assert(static_cast<int>(valueFrequencies2.size()) >= numGroups);

    for (int i = 0; i < numGroups; ++i) {
        assert(valueFrequencies1[i].count == valueFrequencies2[i].count);

        Outcome outcome = compareValues(valueFrequencies1[i].value, valueFrequencies2[i].value);
        if (outcome != Outcome::Tie) {
            return outcome;
        }
    }
    return Outcome::Tie;
}

Outcome compareSameHandType(const Hand& sortedHand1, const Hand& sortedHand2, HandType handType) {
    std::vector<ValueFrequency> valueFrequencies1 = getValueFrequencies(sortedHand1);
    std::vector<ValueFrequency> valueFrequencies2 = getValueFrequencies(sortedHand2);

    switch (handType) {
        case HandType::RoyalFlush:
        case HandType::StraightFlush:
        case HandType::Straight:
        case HandType::Flush:
        case HandType::HighCard:
            return compareHighCards(sortedHand1, sortedHand2);

        case HandType::FourOfAKind:
        case HandType::FullHouse:
            return compareValueGroups(valueFrequencies1, valueFrequencies2, 2);

        case HandType::TwoPair:
            return compareValueGroups(valueFrequencies1, valueFrequencies2, 3);

        case HandType::ThreeOfAKind:
        case HandType::Pair: {
            Outcome outcome = compareValueGroups(valueFrequencies1, valueFrequencies2, 1);
            if (outcome != Outcome::Tie) {
                return outcome;
            }

            // Kickers
            return compareHighCards(sortedHand1, sortedHand2);
        }

        default:
            assert(false);
            return Outcome::Tie;
    }
}
} // namespace

Hand sortHandDescending(const Hand& hand) {
    Hand sortedHand = hand;
    std::stable_sort(sortedHand.begin(), sortedHand.end(), [](const Card& lhs, const Card& rhs) {
        return lhs.value > rhs.value;
    });
    return sortedHand;
}

std::vector<ValueFrequency> getValueFrequencies(const Hand& hand) {
    static constexpr int NumValueSlots = static_cast<int>(Value::Ace) + 1;

    std::array<int, NumValueSlots> counts = {};
    for (const Card& card : hand) {
        ++counts[getRankNumber(card.value)];
    }

    std::vector<ValueFrequency> valueFrequencies;
    for (int valueID = static_cast<int>(Value::Two); valueID < NumValueSlots; ++valueID) {
        if (counts[valueID] > 0) {
            valueFrequencies.push_back({ counts[valueID], static_cast<Value>(valueID) });
        }
    }
    std::sort(valueFrequencies.begin(), valueFrequencies.end(), std::greater<ValueFrequency>());

    return valueFrequencies;
}

HandType classifyHand(const Hand& hand) {
    return classifySortedHand(sortHandDescending(hand));
}

std::string getHandTypeName(HandType handType) {
    switch (handType) {
        case HandType::HighCard:
            return "High Card";
        case HandType::Pair:
            return "Pair";
        case HandType::TwoPair:
            return "Two Pair";
        case HandType::ThreeOfAKind:
            return "Three of a Kind";
        case HandType::Straight:
            return "Straight";
        case HandType::Flush:
            return "Flush";
        case HandType::FullHouse:
            return "Full House";
        case HandType::FourOfAKind:
            return "Four of a Kind";
        case HandType::StraightFlush:
            return "Straight Flush";
        case HandType::RoyalFlush:
            return "Royal Flush";
        default:
            assert(false);
            return "";
    }
}

Outcome compareHands(const Hand& hand1, const Hand& hand2) {
    Hand sortedHand1 = sortHandDescending(hand1);
    Hand sortedHand2 = sortHandDescending(hand2);

    HandType handType1 = classifySortedHand(sortedHand1);
    HandType handType2 = classifySortedHand(sortedHand2);

    if (handType1 != handType2) {
        return (handType1 > handType2) ? Outcome::FirstWins : Outcome::SecondWins;
    }

    return compareSameHandType(sortedHand1, sortedHand2, handType1);
}
