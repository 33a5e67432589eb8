#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    // Register help and exit by default
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    // Command name should be visible characters only
    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    // Command should not already be registered
    if (m_commandDescriptions.find(name) != m_commandDescriptions.end()) {
        return false;
    }

    return true;
}

bool CliDispatcher::takesArgument(const std::string& name) const {
    return m_handlersWithArguments.find(name) != m_handlersWithArguments.end();
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_handlersWithoutArguments.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, argument });
    m_handlersWithArguments.insert({ name, handler });
    return true;
}

void CliDispatcher::run() {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";
    while (m_isRunning) {
        doIteration();
    }
}

bool CliDispatcher::runArguments(const std::vector<std::string>& arguments) {
    int numArguments = static_cast<int>(arguments.size());

    for (int i = 0; i < numArguments; ++i) {
        const std::string& commandName = arguments[i];

        std::optional<std::string> argument;
        if (takesArgument(commandName)) {
            if (i + 1 >= numArguments) {
                std::cerr << "Error: Missing argument for " << commandName << ": Expected <" << m_commandArguments.at(commandName) << ">\n";
                return false;
            }

            ++i;
            argument = arguments[i];
        }

        if (!executeCommand(commandName, argument)) {
            return false;
        }
    }

    return true;
}

bool CliDispatcher::executeCommand(const std::string& name, const std::optional<std::string>& argument) {
    if (m_handlersWithoutArguments.find(name) != m_handlersWithoutArguments.end()) {
        if (argument) {
            std::cerr << "Error: Incorrect number of arguments provided for " << name << ": Expected 0, got 1\n";
            return false;
        }

        return m_handlersWithoutArguments[name]();
    }
    else if (m_handlersWithArguments.find(name) != m_handlersWithArguments.end()) {
        if (!argument) {
            std::cerr << "Error: Incorrect number of arguments provided for " << name << ": Expected 1, got 0\n";
            return false;
        }

        return m_handlersWithArguments[name](*argument);
    }
    else {
        std::cerr << "Error: Unknown command: " << name << "\n";
        return false;
    }
}

bool CliDispatcher::doIteration() {
    std::cout << "> ";
    std::string userInput;
    if (!std::getline(std::cin, userInput)) {
        // End of input behaves like exit
        return handleExit();
    }

    std::vector<std::string> tokens = parseWhitespaceTokens(userInput);
    if (tokens.empty()) {
        return false;
    }

    const std::string& commandName = tokens[0];
    int numArguments = static_cast<int>(tokens.size()) - 1;
    if (numArguments > 1) {
        std::cerr << "Error: Incorrect number of arguments provided for " << commandName << ": Expected at most 1, got " << numArguments << "\n";
        return false;
    }

    std::optional<std::string> argument;
    if (numArguments == 1) {
        argument = tokens[1];
    }

    return executeCommand(commandName, argument);
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " options:\n";
    for (const std::string& name : m_commandOrder) {
        std::cout << name;

        if (m_commandArguments.find(name) != m_commandArguments.end()) {
            std::cout << " <" << m_commandArguments.at(name) << "> ";
        }

        std::cout << ": " << m_commandDescriptions.at(name) << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
