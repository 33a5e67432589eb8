#ifndef HAND_EVALUATION_HPP
#define HAND_EVALUATION_HPP

#include "game/game_types.hpp"

#include <string>
#include <vector>

Hand sortHandDescending(const Hand& hand);

// One entry per distinct value, sorted by count and then by value, both descending.
// For example, a two pair hand of Aces and Fives with a Nine produces {2, A}, {2, 5}, {1, 9}.
std::vector<ValueFrequency> getValueFrequencies(const Hand& hand);

HandType classifyHand(const Hand& hand);
std::string getHandTypeName(HandType handType);

// Pure function of the two hands, the order of the cards within each hand is irrelevant
Outcome compareHands(const Hand& hand1, const Hand& hand2);

#endif // HAND_EVALUATION_HPP
