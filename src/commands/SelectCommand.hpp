#pragma once

#include "Command.hpp"
#include "../engine/TransferEngine.hpp"
#include <string>
#include <vector>

// Dry run of file selection and the initial piece plan for a file listing
class SelectCommand : public Command {
public:
    void execute(const CommandOptions& options) override;
    std::string usage() const override { return "[-l <piece-length>] <path:length>..."; }

    // "path:length" entries laid out back to back in piece space
    static std::vector<FileEntry> parseListing(const std::vector<std::string>& args);

    static constexpr int64_t DEFAULT_PIECE_LENGTH = 256 * 1024;
};
