#pragma once
#include "../engine/TransferEngine.hpp"
#include "../manager/SessionManager.hpp"
#include "../stream/StreamReader.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Maps the HTTP surface onto the session manager and the streaming reader
class RequestRouter {
public:
    RequestRouter(std::shared_ptr<SessionManager> sessions, const ReaderOptions& reader_options);

    // Writes the whole response. Returns false when the connection must close.
    bool handle(const Request& request, tcp::socket& socket, const CancelCheck& cancelled);

    static constexpr size_t STREAM_CHUNK = 64 * 1024;

private:
    Response handleAdd(const Request& request, const std::string& query);
    Response handleStatus(const Request& request);
    Response handleStop(const Request& request);
    bool handleStream(const Request& request, tcp::socket& socket, const CancelCheck& cancelled);

    static Response textResponse(const Request& request, http::status status, const std::string& body);
    static Response jsonResponse(const Request& request, const nlohmann::json& body);
    static bool send(tcp::socket& socket, Response& response);

    std::shared_ptr<SessionManager> sessions;
    ReaderOptions reader_options;
};
