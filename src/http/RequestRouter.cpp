#include "RequestRouter.hpp"
#include "HttpRange.hpp"
#include "HttpUtils.hpp"
#include "../engine/Errors.hpp"
#include "../utils/MagnetUtils.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <vector>

RequestRouter::RequestRouter(std::shared_ptr<SessionManager> sessions, const ReaderOptions& reader_options)
    : sessions(std::move(sessions)), reader_options(reader_options) {
}

Response RequestRouter::textResponse(const Request& request, http::status status, const std::string& body) {
    Response response{status, request.version()};
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.keep_alive(request.keep_alive());
    response.body() = body;
    response.prepare_payload();
    return response;
}

Response RequestRouter::jsonResponse(const Request& request, const nlohmann::json& body) {
    Response response{http::status::ok, request.version()};
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump() + "\n";
    response.prepare_payload();
    return response;
}

bool RequestRouter::send(tcp::socket& socket, Response& response) {
    beast::error_code ec;
    http::write(socket, response, ec);
    if (ec) {
        std::cerr << "[http] Write failed: " << ec.message() << std::endl;
        return false;
    }
    return response.keep_alive();
}

bool RequestRouter::handle(const Request& request, tcp::socket& socket, const CancelCheck& cancelled) {
    auto target = request.target();
    auto [path, query] = HttpUtils::splitTarget(std::string(target.data(), target.size()));

    try {
        if (path == "/stream") {
            return handleStream(request, socket, cancelled);
        }

        Response response;
        if (path == "/add") {
            response = handleAdd(request, query);
        } else if (path == "/status") {
            response = handleStatus(request);
        } else if (path == "/stop") {
            response = handleStop(request);
        } else if (path == "/health") {
            response = textResponse(request, http::status::ok, "OK");
        } else {
            response = textResponse(request, http::status::not_found, "404 page not found\n");
        }
        return send(socket, response);

    } catch (const BadRequestError& e) {
        Response response = textResponse(request, http::status::bad_request, std::string(e.what()) + "\n");
        return send(socket, response);
    } catch (const std::exception& e) {
        std::cerr << "[http] " << request.method_string() << " " << path << " failed: " << e.what() << std::endl;
        Response response = textResponse(request, http::status::internal_server_error, std::string(e.what()) + "\n");
        response.keep_alive(false);
        send(socket, response);
        return false;
    }
}

Response RequestRouter::handleAdd(const Request& request, const std::string& query) {
    if (request.method() != http::verb::post) {
        return textResponse(request, http::status::method_not_allowed, "POST only\n");
    }

    std::string magnet;
    auto params = HttpUtils::parseQuery(query);
    if (params.contains("magnet")) {
        magnet = params.at("magnet");
    }
    auto content_type_field = request[http::field::content_type];
    std::string content_type(content_type_field.data(), content_type_field.size());
    if (magnet.empty() && content_type.starts_with("application/x-www-form-urlencoded")) {
        auto form = HttpUtils::parseQuery(request.body());
        if (form.contains("magnet")) {
            magnet = form.at("magnet");
        }
    }
    if (magnet.empty()) {
        throw BadRequestError("magnet param required");
    }

    nlohmann::json link = MagnetUtils::parseMagnetLink(magnet);
    std::cout << "[http] Adding torrent " << link["info_hash"].get<std::string>() << std::endl;

    sessions->start(magnet);
    return jsonResponse(request, {{"status", "loading"}});
}

Response RequestRouter::handleStatus(const Request& request) {
    return jsonResponse(request, sessions->snapshot().toJson());
}

Response RequestRouter::handleStop(const Request& request) {
    sessions->stop();
    return textResponse(request, http::status::ok, "stopped");
}

bool RequestRouter::handleStream(const Request& request, tcp::socket& socket, const CancelCheck& cancelled) {
    if (request.method() != http::verb::get && request.method() != http::verb::head) {
        Response response = textResponse(request, http::status::method_not_allowed, "GET only\n");
        return send(socket, response);
    }

    ActiveStream stream;
    try {
        stream = sessions->activeStream();
    } catch (const NoActiveSessionError& e) {
        Response response = textResponse(request, http::status::service_unavailable, std::string(e.what()) + "\n");
        return send(socket, response);
    }

    StreamReader reader(stream, reader_options);
    const int64_t length = reader.length();

    // A stale validator means the client must get the whole representation
    auto range_field = request[http::field::range];
    auto if_range_field = request[http::field::if_range];
    std::string range_header(range_field.data(), range_field.size());
    std::string if_range(if_range_field.data(), if_range_field.size());
    if (!if_range.empty() && if_range != reader.identity()) {
        range_header.clear();
    }

    std::optional<ByteRange> range;
    try {
        range = HttpRange::parse(range_header, length);
    } catch (const RangeNotSatisfiableError&) {
        Response response = textResponse(request, http::status::range_not_satisfiable, "invalid range\n");
        response.set(http::field::content_range, HttpRange::unsatisfiedRange(length));
        return send(socket, response);
    }

    ByteRange body{0, length - 1};
    http::response<http::buffer_body> response;
    response.version(request.version());
    response.keep_alive(request.keep_alive());
    if (range) {
        body = *range;
        response.result(http::status::partial_content);
        response.set(http::field::content_range, HttpRange::contentRange(body, length));
    } else {
        response.result(http::status::ok);
    }
    response.set(http::field::content_type, HttpUtils::contentTypeFor(stream.file.path));
    response.set(http::field::accept_ranges, "bytes");
    response.set(http::field::cache_control, "no-cache");
    response.set(http::field::etag, reader.identity());
    response.content_length(static_cast<uint64_t>(body.length()));

    beast::error_code ec;
    if (request.method() == http::verb::head || body.length() <= 0) {
        http::response<http::empty_body> head{response.base()};
        http::write(socket, head, ec);
        return !ec && head.keep_alive();
    }

    http::response_serializer<http::buffer_body> serializer{response};
    response.body().data = nullptr;
    response.body().more = true;
    http::write_header(socket, serializer, ec);
    if (ec) {
        return false;
    }

    std::vector<char> chunk(STREAM_CHUNK);
    int64_t position = body.start;
    int64_t remaining = body.length();
    try {
        while (remaining > 0) {
            size_t wanted = static_cast<size_t>(std::min<int64_t>(remaining, static_cast<int64_t>(chunk.size())));
            size_t got = reader.read(position, chunk.data(), wanted, cancelled);
            if (got == 0) {
                throw TransferClosedError("short read at byte " + std::to_string(position));
            }

            response.body().data = chunk.data();
            response.body().size = got;
            response.body().more = true;
            http::write(socket, serializer, ec);
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                return false;  // client went away
            }
            position += static_cast<int64_t>(got);
            remaining -= static_cast<int64_t>(got);
        }
    } catch (const ReadCancelledError&) {
        return false;
    } catch (const StreamError& e) {
        std::cerr << "[http] Stream aborted at byte " << position << ": " << e.what() << std::endl;
        return false;
    }

    response.body().data = nullptr;
    response.body().more = false;
    http::write(socket, serializer, ec);
    return !ec && response.keep_alive();
}
