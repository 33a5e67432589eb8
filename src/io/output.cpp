#include "io/output.hpp"

#include "game/tally.hpp"

#include <fstream>
#include <iostream>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace {
using json = nlohmann::ordered_json;
} // namespace

json buildTallyJSON(const WinTally& tally, TiePolicy tiePolicy) {
    json j;
    j["Player1Wins"] = tally.player1Wins;
    j["Player2Wins"] = tally.player2Wins;
    j["Ties"] = tally.ties;
    j["SkippedLines"] = tally.skippedLines;
    j["TiePolicy"] = getTiePolicyName(tiePolicy);
    return j;
}

bool outputTallyToJSON(const WinTally& tally, TiePolicy tiePolicy, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open " << filePath << " for writing.\n";
        return false;
    }

    json j = buildTallyJSON(tally, tiePolicy);
    file << j.dump(4) << std::endl;
    return true;
}

void printTally(std::ostream& os, const WinTally& tally, TiePolicy tiePolicy) {
    os << "Player 1: " << tally.player1Wins << "\n";
    os << "Player 2: " << tally.player2Wins << "\n";

    // Other policies have already folded ties into a player's count
    if (tiePolicy == TiePolicy::Separate) {
        os << "Ties: " << tally.ties << "\n";
    }

    if (tally.skippedLines > 0) {
        os << "Skipped lines: " << tally.skippedLines << "\n";
    }
}
