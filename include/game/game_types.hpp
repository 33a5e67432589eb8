#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include "game/config.hpp"

#include <array>
#include <compare>
#include <cstdint>

enum class Value : std::uint8_t {
    Two = 2,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King,
    Ace
};

// Suits are stored exactly as they appear in the input
using Suit = char;

struct Card {
    Value value;
    Suit suit;

    bool operator==(const Card&) const = default;
};

using Hand = std::array<Card, showdown::HandSize>;

enum class HandType : std::uint8_t {
    HighCard,
    Pair,
    TwoPair,
    ThreeOfAKind,
    Straight,
    Flush,
    FullHouse,
    FourOfAKind,
    StraightFlush,
    RoyalFlush,
};

enum class Outcome : std::uint8_t {
    FirstWins,
    SecondWins,
    Tie
};

struct ValueFrequency {
    int count;
    Value value;

    auto operator<=>(const ValueFrequency&) const = default;
};

#endif // GAME_TYPES_HPP
