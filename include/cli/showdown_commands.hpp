#ifndef SHOWDOWN_COMMANDS_HPP
#define SHOWDOWN_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "cli/settings.hpp"
#include "game/tally.hpp"

#include <optional>

// The tie policy is recorded with the tally because it decides which bucket the ties were folded into
struct TallyRecord {
    WinTally tally;
    TiePolicy tiePolicy;
};

struct ShowdownContext {
    Settings settings;
    std::optional<TallyRecord> lastTally;
};

bool registerAllCommands(CliDispatcher& dispatcher, ShowdownContext& context);

#endif // SHOWDOWN_COMMANDS_HPP
