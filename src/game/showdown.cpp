#include "game/showdown.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluation.hpp"
#include "game/parse_input.hpp"
#include "game/tally.hpp"
#include "util/result.hpp"

#include <cassert>
#include <iostream>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

std::string getMalformedLinePolicyName(MalformedLinePolicy policy) {
    switch (policy) {
        case MalformedLinePolicy::Abort:
            return "abort";
        case MalformedLinePolicy::Skip:
            return "skip";
        default:
            assert(false);
            return "";
    }
}

Result<MalformedLinePolicy> getMalformedLinePolicyFromName(const std::string& name) {
    for (MalformedLinePolicy policy : { MalformedLinePolicy::Abort, MalformedLinePolicy::Skip }) {
        if (name == getMalformedLinePolicyName(policy)) {
            return policy;
        }
    }
    return "Error: Unknown malformed line policy \"" + name + "\". Expected \"abort\" or \"skip\".";
}

std::vector<Outcome> evaluateShowdownOutcomes(const std::vector<Showdown>& showdowns, int numThreads) {
    assert(numThreads >= showdown::MinNumThreads);

    int numShowdowns = static_cast<int>(showdowns.size());
    std::vector<Outcome> outcomes(numShowdowns);

    // Every line is independent, outcomes are stored by index so the tally keeps the input order
    #ifdef _OPENMP
    omp_set_num_threads(numThreads);
    #pragma omp parallel for schedule(static)
    #endif
    for (int i = 0; i < numShowdowns; ++i) {
        outcomes[i] = compareHands(showdowns[i].hand1, showdowns[i].hand2);
    }

    return outcomes;
}

Result<WinTally, InputError> evaluateShowdowns(std::istream& input, const EvaluationSettings& settings) {
    assert(settings.batchSize > 0);

    WinTally tally;
    std::vector<Showdown> batch;
    batch.reserve(settings.batchSize);

    auto flushBatch = [&batch, &tally, &settings]() {
        std::vector<Outcome> outcomes = evaluateShowdownOutcomes(batch, settings.numThreads);
        tally = tallyOutcomes(outcomes, settings.tiePolicy, tally);
        batch.clear();
    };

    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;

        Result<std::optional<Showdown>, InputError> showdownResult = parseShowdownLine(line, lineNumber);
        if (showdownResult.isError()) {
            const InputError& error = showdownResult.getError();
            if (settings.malformedLinePolicy == MalformedLinePolicy::Abort) {
                return error;
            }

            std::cerr << "Error: " << getInputErrorTypeName(error.type) << ". " << error.message << " Skipping.\n";
            ++tally.skippedLines;
            continue;
        }

        const std::optional<Showdown>& showdownOption = showdownResult.getValue();
        if (showdownOption) {
            batch.push_back(*showdownOption);
            if (static_cast<int>(batch.size()) == settings.batchSize) {
                flushBatch();
            }
        }
    }

    if (!batch.empty()) {
        flushBatch();
    }

    return tally;
}
