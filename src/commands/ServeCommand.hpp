#pragma once

#include "Command.hpp"
#include <string>

class ServeCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override {
        return "[-p <port>] [-c <cache-dir>] [-r <readahead-MiB>] [-t <ready-%>] [-m <metadata-timeout-s>]";
    }
};
