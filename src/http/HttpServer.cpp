#include "HttpServer.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sys/socket.h>

namespace {
ReaderOptions readerOptions(const ServerConfig& config) {
    ReaderOptions options;
    options.readahead = config.readahead_bytes;
    return options;
}
}

HttpServer::HttpServer(std::shared_ptr<SessionManager> sessions, const ServerConfig& config)
    : sessions(sessions), config(config), router(sessions, readerOptions(config)),
      acceptor(ioc), signals(ioc) {
}

HttpServer::~HttpServer() {
    stopping = true;
    drain();
}

unsigned short HttpServer::listen() {
    tcp::endpoint endpoint{boost::asio::ip::make_address(config.bind_address), config.port};
    acceptor.open(endpoint.protocol());
    acceptor.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(boost::asio::socket_base::max_listen_connections);

    unsigned short port = acceptor.local_endpoint().port();
    sessions->setStreamUrl("http://" + config.bind_address + ":" + std::to_string(port) + "/stream");
    std::cout << "RoxBox server listening on " << config.bind_address << ":" << port << std::endl;

    doAccept();
    return port;
}

void HttpServer::handleSignals() {
    signals.add(SIGINT);
    signals.add(SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        std::cout << "Shutting down..." << std::endl;
        stop();
    });
}

void HttpServer::run() {
    ioc.run();
    drain();
}

void HttpServer::stop() {
    stopping = true;
    boost::asio::post(ioc, [this] {
        boost::system::error_code ec;
        acceptor.close(ec);
        signals.cancel(ec);
    });
}

void HttpServer::doAccept() {
    acceptor.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (!stopping && ec != boost::asio::error::operation_aborted) {
                std::cerr << "[http] Accept failed: " << ec.message() << std::endl;
            }
        } else if (!stopping) {
            reap();
            auto connection = std::make_shared<Connection>(std::move(socket));
            std::lock_guard<std::mutex> lock(connections_mutex);
            connections.push_back(connection);
            connection->thread = std::thread(&HttpServer::serve, this, connection);
        }
        if (acceptor.is_open() && !stopping) {
            doAccept();
        }
    });
}

bool HttpServer::peerClosed(int fd) {
    char byte;
    ssize_t n = ::recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n == 0) {
        return true;
    }
    return n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
}

void HttpServer::serve(std::shared_ptr<Connection> connection) {
    tcp::socket& socket = connection->socket;
    const int fd = socket.native_handle();
    CancelCheck cancelled = [this, fd] { return stopping.load() || peerClosed(fd); };

    try {
        beast::flat_buffer buffer;
        while (!stopping) {
            Request request;
            beast::error_code ec;
            http::read(socket, buffer, request, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                if (!stopping && ec != boost::asio::error::connection_reset && ec != boost::asio::error::eof) {
                    std::cerr << "[http] Read failed: " << ec.message() << std::endl;
                }
                break;
            }

            connection->busy = true;
            bool keep_alive = router.handle(request, socket, cancelled);
            connection->busy = false;
            if (!keep_alive) {
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[http] Connection error: " << e.what() << std::endl;
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
    connection->busy = false;
    connection->finished = true;
}

void HttpServer::forceClose(Connection& connection) {
    ::shutdown(connection.socket.native_handle(), SHUT_RDWR);
}

void HttpServer::reap() {
    std::lock_guard<std::mutex> lock(connections_mutex);
    for (auto it = connections.begin(); it != connections.end();) {
        if ((*it)->finished) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = connections.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::drain() {
    auto deadline = std::chrono::steady_clock::now() + config.shutdown_grace;
    while (true) {
        reap();
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            if (connections.empty()) {
                return;
            }
            // Idle keep-alive connections have nothing to finish
            for (auto& connection : connections) {
                if (!connection->busy && !connection->finished) {
                    forceClose(*connection);
                }
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::lock_guard<std::mutex> lock(connections_mutex);
    for (auto& connection : connections) {
        if (!connection->finished) {
            std::cerr << "[http] Closing connection after grace period" << std::endl;
            forceClose(*connection);
        }
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }
    connections.clear();
}
