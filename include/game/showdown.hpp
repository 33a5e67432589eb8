#ifndef SHOWDOWN_HPP
#define SHOWDOWN_HPP

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/parse_input.hpp"
#include "game/tally.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

enum class MalformedLinePolicy : std::uint8_t {
    Abort,
    Skip
};

struct EvaluationSettings {
    TiePolicy tiePolicy = TiePolicy::Separate;
    MalformedLinePolicy malformedLinePolicy = MalformedLinePolicy::Abort;
    int numThreads = 1;
    int batchSize = showdown::DefaultBatchSize;
};

std::string getMalformedLinePolicyName(MalformedLinePolicy policy);
Result<MalformedLinePolicy> getMalformedLinePolicyFromName(const std::string& name);

std::vector<Outcome> evaluateShowdownOutcomes(const std::vector<Showdown>& showdowns, int numThreads);

// Reads one showdown per line until the end of the stream.
// At most batchSize showdowns are held in memory, each batch is folded into the tally in input order.
// With MalformedLinePolicy::Abort the first bad line is returned as the error and no totals are produced.
Result<WinTally, InputError> evaluateShowdowns(std::istream& input, const EvaluationSettings& settings);

#endif // SHOWDOWN_HPP
