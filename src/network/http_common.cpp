#include "puresend/network/http_common.hpp"
#include "puresend/core/logger.hpp"
#include "puresend/core/utils.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sys/socket.h>

namespace puresend::network {

namespace {
    constexpr std::size_t FILE_BLOCK_SIZE = 64 * 1024;
    constexpr const char* SERVER_NAME = "PureSend";

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::string ascii_fallback(const std::string& name) {
        std::string result;
        for (unsigned char c : name) {
            if (c < 0x20 || c >= 0x7f || c == '"' || c == '\\') {
                result.push_back('_');
            } else {
                result.push_back(static_cast<char>(c));
            }
        }
        return result;
    }
}

std::string url_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::string content_disposition(const std::string& file_name) {
    return "attachment; filename=\"" + ascii_fallback(file_name) + "\"; filename*=UTF-8''" +
           core::utils::StringUtils::percent_encode(file_name);
}

HttpExchange::HttpExchange(tcp::socket& socket, HttpRequest& request, std::string client_ip)
    : socket_(socket)
    , request_(request)
    , client_ip_(std::move(client_ip))
    , responded_(false) {
    std::string target(request_.target());
    auto question = target.find('?');
    if (question != std::string::npos) {
        query_ = target.substr(question + 1);
        target.resize(question);
    }
    path_ = url_decode(target);
}

std::optional<std::string> HttpExchange::query(const std::string& key) const {
    for (const auto& pair : core::utils::StringUtils::split(query_, '&')) {
        auto equals = pair.find('=');
        auto plain = pair;
        std::replace(plain.begin(), plain.end(), '+', ' ');
        auto name = url_decode(plain.substr(0, equals));
        if (name == key) {
            return equals == std::string::npos ? std::string() : url_decode(plain.substr(equals + 1));
        }
    }
    return std::nullopt;
}

std::string HttpExchange::header(const std::string& name) const {
    auto it = request_.find(name);
    return it == request_.end() ? std::string() : std::string(it->value());
}

nlohmann::json HttpExchange::json_body() const {
    return nlohmann::json::parse(request_.body(), nullptr, false);
}

template<typename Body>
core::Result HttpExchange::write(http::response<Body>& response) {
    response.set(http::field::server, SERVER_NAME);
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(false);
    response.prepare_payload();

    beast::error_code ec;
    http::write(socket_, response, ec);
    responded_ = true;
    if (ec) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "HTTP write to " + client_ip_ + ": " + ec.message());
    }
    return core::Result();
}

core::Result HttpExchange::send_json(http::status status, const nlohmann::json& body) {
    http::response<http::string_body> response{status, request_.version()};
    response.set(http::field::content_type, "application/json; charset=utf-8");
    response.set(http::field::cache_control, "no-store");
    response.body() = body.dump();
    return write(response);
}

core::Result HttpExchange::send_html(http::status status, const std::string& body) {
    http::response<http::string_body> response{status, request_.version()};
    response.set(http::field::content_type, "text/html; charset=utf-8");
    response.body() = body;
    return write(response);
}

core::Result HttpExchange::send_text(http::status status, const std::string& body) {
    http::response<http::string_body> response{status, request_.version()};
    response.set(http::field::content_type, "text/plain; charset=utf-8");
    response.body() = body;
    return write(response);
}

core::Result HttpExchange::send_file(const std::filesystem::path& path,
                                     const std::string& download_name,
                                     const std::string& mime_type,
                                     const std::function<bool(std::uint64_t)>& on_progress) {
    std::error_code size_ec;
    auto size = std::filesystem::file_size(path, size_ec);
    std::ifstream file(path, std::ios::binary);
    if (size_ec || !file) {
        auto failed = send_text(http::status::not_found, "File not available");
        if (!failed) {
            LOG_DEBUG("{}", failed.describe());
        }
        return core::Result(core::ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }

    http::response<http::buffer_body> response{http::status::ok, request_.version()};
    response.set(http::field::server, SERVER_NAME);
    response.set(http::field::access_control_allow_origin, "*");
    response.set(http::field::content_type, mime_type.empty() ? "application/octet-stream" : mime_type);
    response.set(http::field::content_disposition, content_disposition(download_name));
    response.content_length(size);
    response.keep_alive(false);
    response.body().data = nullptr;
    response.body().more = true;
    responded_ = true;

    http::response_serializer<http::buffer_body> serializer{response};
    beast::error_code ec;
    http::write_header(socket_, serializer, ec);
    if (ec) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Download to " + client_ip_ + ": " + ec.message());
    }

    std::vector<char> block(FILE_BLOCK_SIZE);
    std::uint64_t sent = 0;
    while (sent < size) {
        auto wanted = static_cast<std::streamsize>(std::min<std::uint64_t>(block.size(), size - sent));
        file.read(block.data(), wanted);
        auto got = file.gcount();
        if (got <= 0) {
            return core::Result(core::ErrorCode::IO_ERROR, "Short read from " + path.string());
        }

        response.body().data = block.data();
        response.body().size = static_cast<std::size_t>(got);
        response.body().more = true;
        http::write(socket_, serializer, ec);
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            return core::Result(core::ErrorCode::NETWORK_ERROR, "Download to " + client_ip_ + ": " + ec.message());
        }

        sent += static_cast<std::uint64_t>(got);
        if (on_progress && !on_progress(sent)) {
            beast::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
            return core::Result(core::ErrorCode::CANCELLED, "Download aborted");
        }
    }

    response.body().data = nullptr;
    response.body().more = false;
    http::write(socket_, serializer, ec);
    if (ec && ec != http::error::need_buffer) {
        return core::Result(core::ErrorCode::NETWORK_ERROR, "Download to " + client_ip_ + ": " + ec.message());
    }
    return core::Result();
}

HttpServer::HttpServer(std::string name, std::uint16_t port, Handler handler, std::uint64_t body_limit)
    : name_(std::move(name))
    , server_(name_, port)
    , handler_(std::move(handler))
    , body_limit_(body_limit)
    , running_(false) {
    server_.set_connection_handler([this](tcp::socket socket) {
        accept(std::move(socket));
    });
}

HttpServer::~HttpServer() {
    stop();
}

core::Result HttpServer::start() {
    if (running_) {
        return core::Result(core::ErrorCode::STATE_ERROR, name_ + " server already running");
    }

    auto result = server_.start();
    if (!result) {
        return result;
    }
    running_ = true;
    return core::Result();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    server_.stop();

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (int fd : open_sockets_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }
    reap_workers(true);
}

void HttpServer::accept(tcp::socket socket) {
    if (!running_) {
        return;
    }

    reap_workers(false);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    int fd = socket.native_handle();
    open_sockets_.insert(fd);
    std::thread thread([this, done, fd, socket = std::move(socket)]() mutable {
        serve(socket);
        {
            std::lock_guard<std::mutex> guard(workers_mutex_);
            open_sockets_.erase(fd);
        }
        beast::error_code ec;
        socket.close(ec);
        *done = true;
    });
    workers_.push_back(Worker{std::move(thread), done});
}

void HttpServer::serve(tcp::socket& socket) {
    beast::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    std::string client_ip = ec ? "unknown" : remote.address().to_string();

    beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit(body_limit_);
    http::read(socket, buffer, parser, ec);
    if (ec) {
        if (ec == http::error::body_limit) {
            http::response<http::string_body> response{http::status::payload_too_large, 11};
            response.set(http::field::content_type, "text/plain");
            response.body() = "Request body too large";
            response.keep_alive(false);
            response.prepare_payload();
            beast::error_code write_ec;
            http::write(socket, response, write_ec);
        } else if (ec != http::error::end_of_stream) {
            LOG_DEBUG("{}: bad request from {}: {}", name_, client_ip, ec.message());
        }
        return;
    }

    HttpRequest request = parser.release();
    HttpExchange exchange(socket, request, client_ip);
    LOG_DEBUG("{}: {} {} from {}", name_, std::string(request.method_string()), exchange.path(), client_ip);

    try {
        handler_(exchange);
    } catch (const std::exception& e) {
        LOG_ERROR("{}: handler failed for {}: {}", name_, exchange.path(), e.what());
        if (!exchange.responded()) {
            auto result = exchange.send_text(http::status::internal_server_error, "Internal error");
            if (!result) {
                LOG_DEBUG("{}", result.describe());
            }
        }
        return;
    }

    if (!exchange.responded()) {
        auto result = exchange.send_text(http::status::not_found, "Not found");
        if (!result) {
            LOG_DEBUG("{}", result.describe());
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void HttpServer::reap_workers(bool wait_all) {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (wait_all || *it->done) {
                finished.push_back(std::move(it->thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& thread : finished) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace puresend::network
