#include "commands/MagnetParseCommand.hpp"
#include "commands/SelectCommand.hpp"
#include "commands/ServeCommand.hpp"
#include "manager/CommandManager.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    CommandManager manager;
    manager.registerCommand("serve", std::make_unique<ServeCommand>());
    manager.registerCommand("magnet_parse", std::make_unique<MagnetParseCommand>());
    manager.registerCommand("select", std::make_unique<SelectCommand>());

    if (argc < 2) {
        manager.printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    CommandOptions options = CommandOptions::parse(argc, argv);

    return manager.executeCommand(command, options);
}
