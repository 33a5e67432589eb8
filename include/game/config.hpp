#ifndef CONFIG_HPP
#define CONFIG_HPP

namespace showdown {
constexpr int HandSize = 5;
constexpr int CardsPerShowdown = 2 * HandSize; // Player 1's hand followed by player 2's
constexpr int CardNameLength = 2;

// Lines are parsed, evaluated, and folded this many at a time
constexpr int DefaultBatchSize = 1 << 16;

constexpr int MinNumThreads = 1;
constexpr int MaxNumThreads = 64;
} // namespace showdown

#endif // CONFIG_HPP
