#include "cli/showdown_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "cli/settings.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/hand_evaluation.hpp"
#include "game/parse_input.hpp"
#include "game/showdown.hpp"
#include "game/tally.hpp"
#include "io/output.hpp"
#include "util/result.hpp"
#include "util/scoped_timer.hpp"
#include "util/string_utils.hpp"

#include <fstream>
#include <iostream>
#include <istream>
#include <optional>
#include <string>

namespace {
void printSettings(const Settings& settings) {
    std::cout << "Tie policy: " << getTiePolicyName(settings.evaluation.tiePolicy) << "\n";
    std::cout << "Malformed lines: " << getMalformedLinePolicyName(settings.evaluation.malformedLinePolicy) << "\n";
    std::cout << "Threads: " << settings.evaluation.numThreads << "\n";
    std::cout << "Report: " << (settings.reportPath ? *settings.reportPath : "none") << "\n";
}

bool writeReportIfNeeded(const ShowdownContext& context) {
    if (!context.settings.reportPath || !context.lastTally) {
        return true;
    }

    const std::string& reportPath = *context.settings.reportPath;
    if (!outputTallyToJSON(context.lastTally->tally, context.lastTally->tiePolicy, reportPath)) {
        return false;
    }

    std::cout << "Wrote report to " << reportPath << ".\n";
    return true;
}

bool handleLoadSettings(ShowdownContext& context, const std::string& argument) {
    Result<Settings> settingsResult = loadSettingsFromFile(argument);
    if (settingsResult.isError()) {
        std::cerr << settingsResult.getError() << "\n";
        return false;
    }

    context.settings = settingsResult.getValue();
    std::cout << "Successfully loaded settings.\n";
    printSettings(context.settings);
    return true;
}

bool handlePrintSettings(const ShowdownContext& context) {
    printSettings(context.settings);
    return true;
}

bool handleSetTiePolicy(ShowdownContext& context, const std::string& argument) {
    Result<TiePolicy> tiePolicyResult = getTiePolicyFromName(argument);
    if (tiePolicyResult.isError()) {
        std::cerr << tiePolicyResult.getError() << "\n";
        return false;
    }

    context.settings.evaluation.tiePolicy = tiePolicyResult.getValue();
    std::cout << "Successfully set tie policy to " << argument << ".\n";
    return true;
}

bool handleSetMalformedLinePolicy(ShowdownContext& context, const std::string& argument) {
    Result<MalformedLinePolicy> policyResult = getMalformedLinePolicyFromName(argument);
    if (policyResult.isError()) {
        std::cerr << policyResult.getError() << "\n";
        return false;
    }

    context.settings.evaluation.malformedLinePolicy = policyResult.getValue();
    std::cout << "Successfully set malformed line policy to " << argument << ".\n";
    return true;
}

bool handleSetNumThreads(ShowdownContext& context, const std::string& argument) {
    #ifdef _OPENMP
    std::optional<int> numThreadsOption = parseInt(argument);
    if (!numThreadsOption) {
        std::cerr << "Error: Thread count must be an integer.\n";
        return false;
    }

    Result<int> numThreadsResult = validateNumThreads(*numThreadsOption);
    if (numThreadsResult.isError()) {
        std::cerr << numThreadsResult.getError() << "\n";
        return false;
    }

    context.settings.evaluation.numThreads = numThreadsResult.getValue();
    std::cout << "Successfully set number of threads to " << context.settings.evaluation.numThreads << ".\n";
    return true;
    #else
    context.settings.evaluation.numThreads = 1;
    std::cerr << "Error: OpenMP is not enabled, ignoring. Only single-threaded mode is supported.\n";
    return false;
    #endif
}

bool handleSetReport(ShowdownContext& context, const std::string& argument) {
    context.settings.reportPath = argument;
    std::cout << "Reports will be written to " << argument << ".\n";
    return writeReportIfNeeded(context);
}

bool handleTally(ShowdownContext& context, const std::string& argument) {
    auto runTally = [&context](std::istream& input) -> Result<WinTally, InputError> {
        ScopedTimer timer(std::cout, "", "Evaluated showdowns");
        return evaluateShowdowns(input, context.settings.evaluation);
    };

    std::optional<Result<WinTally, InputError>> tallyResultOption;
    if (argument == "-") {
        tallyResultOption = runTally(std::cin);
    }
    else {
        std::ifstream file(argument);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open " << argument << ".\n";
            return false;
        }
        tallyResultOption = runTally(file);
    }

    const Result<WinTally, InputError>& tallyResult = *tallyResultOption;
    if (tallyResult.isError()) {
        const InputError& error = tallyResult.getError();
        std::cerr << "Error: " << getInputErrorTypeName(error.type) << ". " << error.message << "\n";
        return false;
    }

    context.lastTally = TallyRecord{ .tally = tallyResult.getValue(), .tiePolicy = context.settings.evaluation.tiePolicy };
    printTally(std::cout, context.lastTally->tally, context.lastTally->tiePolicy);
    return writeReportIfNeeded(context);
}

bool handleCompare(const std::string& argument) {
    Result<Showdown, InputError> showdownResult = buildShowdownFromString(argument);
    if (showdownResult.isError()) {
        const InputError& error = showdownResult.getError();
        std::cerr << "Error: " << getInputErrorTypeName(error.type) << ". " << error.message << "\n";
        return false;
    }

    const Showdown& parsedShowdown = showdownResult.getValue();
    for (const Hand* hand : { &parsedShowdown.hand1, &parsedShowdown.hand2 }) {
        std::cout << join(getHandNames(sortHandDescending(*hand)), " ") << ": " << getHandTypeName(classifyHand(*hand)) << "\n";
    }
    std::cout << getOutcomeName(compareHands(parsedShowdown.hand1, parsedShowdown.hand2)) << "\n";
    return true;
}
} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, ShowdownContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "settings",
        "file",
        "Loads settings from a given .yml configuration file.",
        [&context](const std::string& argument) { return handleLoadSettings(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "print-settings",
        "Prints the current settings.",
        [&context]() { return handlePrintSettings(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "tie-policy",
        "policy",
        "Sets how tied showdowns are counted: \"separate\" (default), \"player1\", or \"player2\".",
        [&context](const std::string& argument) { return handleSetTiePolicy(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "malformed-lines",
        "policy",
        "Sets what happens to a line that cannot be parsed: \"abort\" (default) stops the tally, \"skip\" reports the line and continues.",
        [&context](const std::string& argument) { return handleSetMalformedLinePolicy(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "threads",
        "count",
        "Sets the number of threads used to evaluate showdowns. One thread is used by default. Calls to this command will be ignored if OpenMP is not enabled.",
        [&context](const std::string& argument) { return handleSetNumThreads(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "report",
        "file",
        "Writes the totals of every tally to a JSON file.",
        [&context](const std::string& argument) { return handleSetReport(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "tally",
        "file",
        "Evaluates a file with one showdown (ten cards) per line and prints the wins of each player. Use \"-\" for standard input.",
        [&context](const std::string& argument) { return handleTally(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "compare",
        "cards",
        "Compares two hands given as ten comma separated cards, for example AH,KH,QH,JH,TH,9C,9D,9S,9H,2C.",
        [](const std::string& argument) { return handleCompare(argument); }
    );

    return allSuccess;
}
