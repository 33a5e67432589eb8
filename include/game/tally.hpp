#ifndef TALLY_HPP
#define TALLY_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Decides which bucket a tied showdown is counted in
enum class TiePolicy : std::uint8_t {
    Separate,
    CreditPlayer1,
    CreditPlayer2
};

struct WinTally {
    int player1Wins = 0;
    int player2Wins = 0;
    int ties = 0;
    int skippedLines = 0;

    bool operator==(const WinTally&) const = default;
};

std::string getTiePolicyName(TiePolicy tiePolicy);
Result<TiePolicy> getTiePolicyFromName(const std::string& name);

WinTally addOutcome(const WinTally& tally, Outcome outcome, TiePolicy tiePolicy);
WinTally tallyOutcomes(const std::vector<Outcome>& outcomes, TiePolicy tiePolicy, const WinTally& startingTally = WinTally{});

#endif // TALLY_HPP
