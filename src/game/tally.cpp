#include "game/tally.hpp"

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <cassert>
#include <numeric>
#include <string>
#include <vector>

std::string getTiePolicyName(TiePolicy tiePolicy) {
    switch (tiePolicy) {
        case TiePolicy::Separate:
            return "separate";
        case TiePolicy::CreditPlayer1:
            return "player1";
        case TiePolicy::CreditPlayer2:
            return "player2";
        default:
            assert(false);
            return "";
    }
}

Result<TiePolicy> getTiePolicyFromName(const std::string& name) {
    for (TiePolicy tiePolicy : { TiePolicy::Separate, TiePolicy::CreditPlayer1, TiePolicy::CreditPlayer2 }) {
        if (name == getTiePolicyName(tiePolicy)) {
            return tiePolicy;
        }
    }
    return "Error: Unknown tie policy \"" + name + "\". Expected \"separate\", \"player1\", or \"player2\".";
}

WinTally addOutcome(const WinTally& tally, Outcome outcome, TiePolicy tiePolicy) {
    WinTally nextTally = tally;

    switch (outcome) {
        case Outcome::FirstWins:
            ++nextTally.player1Wins;
            break;
        case Outcome::SecondWins:
            ++nextTally.player2Wins;
            break;
        case Outcome::Tie:
            switch (tiePolicy) {
                case TiePolicy::Separate:
                    ++nextTally.ties;
                    break;
                case TiePolicy::CreditPlayer1:
                    ++nextTally.player1Wins;
                    break;
                case TiePolicy::CreditPlayer2:
                    ++nextTally.player2Wins;
                    break;
            }
            break;
    }

    return nextTally;
}

WinTally tallyOutcomes(const std::vector<Outcome>& outcomes, TiePolicy tiePolicy, const WinTally& startingTally) {
    return std::accumulate(outcomes.begin(), outcomes.end(), startingTally, [tiePolicy](const WinTally& tally, Outcome outcome) {
        return addOutcome(tally, outcome, tiePolicy);
    });
}
