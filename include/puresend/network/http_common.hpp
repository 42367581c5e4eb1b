#pragma once

#include "tcp_server.hpp"
#include "../core/error.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace puresend::network {

namespace beast = boost::beast;
namespace http = beast::http;

using HttpRequest = http::request<http::string_body>;

// One request and its response on a blocking socket. The connection is closed afterwards.
class HttpExchange {
public:
    HttpExchange(tcp::socket& socket, HttpRequest& request, std::string client_ip);

    const HttpRequest& request() const { return request_; }
    http::verb method() const { return request_.method(); }
    const std::string& client_ip() const { return client_ip_; }

    // Target without the query string, percent-decoded.
    const std::string& path() const { return path_; }
    std::optional<std::string> query(const std::string& key) const;
    std::string header(const std::string& name) const;
    const std::string& body() const { return request_.body(); }

    // Parsed JSON body; a discarded value when the body is not JSON.
    nlohmann::json json_body() const;

    core::Result send_json(http::status status, const nlohmann::json& body);
    core::Result send_html(http::status status, const std::string& body);
    core::Result send_text(http::status status, const std::string& body);

    // Streams the file in blocks. `on_progress` receives the running byte count after each
    // block; returning false stops the download, which then reports CANCELLED.
    core::Result send_file(const std::filesystem::path& path,
                           const std::string& download_name,
                           const std::string& mime_type,
                           const std::function<bool(std::uint64_t)>& on_progress = nullptr);

    bool responded() const { return responded_; }

private:
    template<typename Body>
    core::Result write(http::response<Body>& response);

    tcp::socket& socket_;
    HttpRequest& request_;
    std::string client_ip_;
    std::string path_;
    std::string query_;
    bool responded_;
};

// "attachment; filename=...; filename*=UTF-8''..." for any file name.
std::string content_disposition(const std::string& file_name);

std::string url_decode(const std::string& text);

// Blocking HTTP/1.1 server with one thread per connection on top of TcpServer's accept loop.
class HttpServer {
public:
    using Handler = std::function<void(HttpExchange&)>;

    static constexpr std::uint64_t DEFAULT_BODY_LIMIT = 16 * 1024 * 1024;

    HttpServer(std::string name, std::uint16_t port, Handler handler,
               std::uint64_t body_limit = DEFAULT_BODY_LIMIT);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    core::Result start();

    // Closes the listener and shuts down every open connection, aborting downloads in flight.
    void stop();

    bool is_running() const { return running_; }
    std::uint16_t get_port() const { return server_.get_port(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept(tcp::socket socket);
    void serve(tcp::socket& socket);
    void reap_workers(bool wait_all);

    std::string name_;
    TcpServer server_;
    Handler handler_;
    std::uint64_t body_limit_;
    std::atomic<bool> running_;

    std::vector<Worker> workers_;
    std::unordered_set<int> open_sockets_;
    std::mutex workers_mutex_;
};

} // namespace puresend::network
