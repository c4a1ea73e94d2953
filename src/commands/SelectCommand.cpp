#include "SelectCommand.hpp"
#include "../engine/Errors.hpp"
#include "../manager/PriorityScheduler.hpp"
#include "../stream/FileSelector.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

std::vector<FileEntry> SelectCommand::parseListing(const std::vector<std::string>& args) {
    std::vector<FileEntry> files;
    int64_t offset = 0;
    for (const std::string& arg : args) {
        size_t colon = arg.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == arg.size()) {
            throw BadRequestError("Expected <path:length>, got: " + arg);
        }
        FileEntry entry;
        entry.index = static_cast<int>(files.size());
        entry.path = arg.substr(0, colon);
        size_t used = 0;
        try {
            entry.length = std::stoll(arg.substr(colon + 1), &used);
        } catch (const std::exception&) {
            throw BadRequestError("Invalid file length: " + arg);
        }
        if (used != arg.size() - colon - 1 || entry.length < 0) {
            throw BadRequestError("Invalid file length: " + arg);
        }
        entry.offset = offset;
        offset += entry.length;
        files.push_back(entry);
    }
    return files;
}

void SelectCommand::execute(const CommandOptions& options) {
    int64_t piece_length = DEFAULT_PIECE_LENGTH;
    if (options.options.contains("-l")) {
        try {
            piece_length = std::stoll(options.options.at("-l"));
        } catch (const std::exception&) {
            throw BadRequestError("Invalid piece length: " + options.options.at("-l"));
        }
        if (piece_length <= 0) {
            throw BadRequestError("Invalid piece length: " + options.options.at("-l"));
        }
    }

    std::vector<FileEntry> files = parseListing(options.args);
    FileEntry file = FileSelector::select(files);

    int64_t total = files.back().offset + files.back().length;
    int num_pieces = static_cast<int>((total + piece_length - 1) / piece_length);

    nlohmann::json immediate = nlohmann::json::array();
    for (const auto& [piece, tier] : PriorityScheduler::plan(file, piece_length, num_pieces, 0)) {
        if (tier == PiecePriority::Immediate) {
            immediate.push_back(piece);
        }
    }

    nlohmann::json result = {
        {"path", file.path},
        {"length", file.length},
        {"offset", file.offset},
        {"pieces", num_pieces},
        {"immediate", immediate}
    };
    std::cout << result.dump(2) << std::endl;
}
