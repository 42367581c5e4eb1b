#pragma once

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace puresend::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct HttpReply {
    http::status status = http::status::unknown;
    std::string body;
    std::map<std::string, std::string> headers;

    nlohmann::json json() const { return nlohmann::json::parse(body, nullptr, false); }
};

// Blocking one-request-per-connection client for driving the HTTP servers in tests.
inline HttpReply http_request(std::uint16_t port,
                              http::verb method,
                              const std::string& target,
                              const std::string& body = {},
                              const std::map<std::string, std::string>& headers = {},
                              const std::string& content_type = "application/json") {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve("127.0.0.1", std::to_string(port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    if (!body.empty() || method == http::verb::post) {
        req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();
    }
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(256 * 1024 * 1024);
    http::read(stream, buffer, parser);
    auto res = parser.release();

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    HttpReply reply;
    reply.status = res.result();
    reply.body = std::move(res.body());
    for (const auto& field : res) {
        reply.headers[std::string(field.name_string())] = std::string(field.value());
    }
    return reply;
}

inline HttpReply http_get(std::uint16_t port, const std::string& target) {
    return http_request(port, http::verb::get, target);
}

inline HttpReply http_post_json(std::uint16_t port, const std::string& target, const nlohmann::json& body) {
    return http_request(port, http::verb::post, target, body.dump());
}

} // namespace puresend::test
