#include "CommandManager.hpp"
#include <iostream>

void CommandManager::registerCommand(const std::string& name, std::unique_ptr<Command> command) {
    commands[name] = std::move(command);
}

int CommandManager::executeCommand(const std::string& name, const CommandOptions& options) {
    auto it = commands.find(name);
    if (it == commands.end()) {
        std::cerr << "Unknown command: " << name << std::endl;
        return 1;
    }
    try {
        it->second->execute(options);
    } catch (const std::exception& e) {
        std::cerr << "Error executing command: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

void CommandManager::printUsage(const std::string& program) const {
    std::cerr << "Usage: " << program << " <command> [options] <args>" << std::endl;
    for (const auto& [name, command] : commands) {
        std::cerr << "  " << name << " " << command->usage() << std::endl;
    }
}
