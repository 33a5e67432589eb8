#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/tally.hpp"

#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

nlohmann::ordered_json buildTallyJSON(const WinTally& tally, TiePolicy tiePolicy);

bool outputTallyToJSON(const WinTally& tally, TiePolicy tiePolicy, const std::string& filePath);
void printTally(std::ostream& os, const WinTally& tally, TiePolicy tiePolicy);

#endif // OUTPUT_HPP
