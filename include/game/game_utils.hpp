#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

// Value functions
Result<Value> getValueFromChar(char c);
char getCharFromValue(Value value);
int getRankNumber(Value value);

// Card functions
Result<Card> getCardFromName(const std::string& cardName);
std::string getNameFromCard(Card card);

// Hand functions
std::vector<std::string> getHandNames(const Hand& hand);

// Outcome functions
Outcome getReversedOutcome(Outcome outcome);
std::string getOutcomeName(Outcome outcome);

#endif // GAME_UTILS_HPP
