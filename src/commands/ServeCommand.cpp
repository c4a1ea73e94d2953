#include "ServeCommand.hpp"
#include "../engine/LibtorrentEngine.hpp"
#include "../http/HttpServer.hpp"
#include "../manager/SessionManager.hpp"
#include "../utils/ServerConfig.hpp"
#include <filesystem>
#include <iostream>

void ServeCommand::execute(const CommandOptions& options) {
    ServerConfig config = ServerConfig::load(options);
    std::filesystem::create_directories(config.cache_dir);
    std::cout << "[serve] Cache directory " << config.cache_dir << std::endl;

    auto engine = std::make_shared<LibtorrentEngine>(config);
    auto sessions = std::make_shared<SessionManager>(engine, config);

    HttpServer server(sessions, config);
    server.listen();
    server.handleSignals();
    server.run();

    std::cout << "[serve] Shutting down..." << std::endl;
    sessions->stop();
}
