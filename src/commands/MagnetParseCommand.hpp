#pragma once

#include "Command.hpp"
#include <string>

class MagnetParseCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override { return "<magnet-link>"; }
};
