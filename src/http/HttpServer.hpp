#pragma once
#include "RequestRouter.hpp"
#include "../manager/SessionManager.hpp"
#include "../utils/ServerConfig.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

// Loopback HTTP service, one thread per connection. run() returns after stop()
// once in-flight responses finish or the shutdown grace period expires.
class HttpServer {
public:
    HttpServer(std::shared_ptr<SessionManager> sessions, const ServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds the listener and returns the bound port (useful when configured as 0)
    unsigned short listen();
    void run();
    // Thread-safe
    void stop();
    // SIGINT / SIGTERM call stop()
    void handleSignals();


private:
    struct Connection {
        explicit Connection(tcp::socket socket) : socket(std::move(socket)) {}
        tcp::socket socket;
        std::thread thread;
        std::atomic<bool> busy{false};
        std::atomic<bool> finished{false};
    };

    void doAccept();
    void serve(std::shared_ptr<Connection> connection);
    void reap();
    void drain();
    static bool peerClosed(int fd);
    static void forceClose(Connection& connection);

    std::shared_ptr<SessionManager> sessions;
    ServerConfig config;
    RequestRouter router;

    boost::asio::io_context ioc;
    tcp::acceptor acceptor;
    boost::asio::signal_set signals;
    std::atomic<bool> stopping{false};

    std::mutex connections_mutex;
    std::list<std::shared_ptr<Connection>> connections;
};
