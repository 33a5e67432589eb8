#include "cli/cli_dispatcher.hpp"
#include "cli/showdown_commands.hpp"

#include <string>
#include <vector>

int main(int argc, char** argv) {
    CliDispatcher dispatcher("Showdown", Version{ .major = 1, .minor = 0, .patch = 0 });
    ShowdownContext context;
    registerAllCommands(dispatcher, context);

    if (argc <= 1) {
        dispatcher.run();
        return 0;
    }

    std::vector<std::string> arguments(argv + 1, argv + argc);
    return dispatcher.runArguments(arguments) ? 0 : 1;
}
