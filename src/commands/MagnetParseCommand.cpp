#include "MagnetParseCommand.hpp"
#include "../utils/MagnetUtils.hpp"
#include <iostream>
#include <stdexcept>

void MagnetParseCommand::execute(const CommandOptions& options) {
    if (options.args.empty()) {
        throw std::runtime_error("No magnet link provided");
    }
    nlohmann::json magnet = MagnetUtils::parseMagnetLink(options.args[0]);
    std::cout << magnet.dump(2) << std::endl;
}
