
#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <string>
#include <cstdlib>
#include <chrono>
#include <thread>
#include <utility>
#include <stdexcept>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

static inline std::string base_url() {
    const char* e = std::getenv("BASE_URL");
    if (e && e[0]) return std::string(e);
    return std::string("http://127.0.0.1:5000");
}

static inline std::pair<std::string,std::string> parse_base_url() {
    std::string b = base_url();
    size_t pos = std::string::npos;
    if (b.rfind("http://", 0) == 0) pos = 7;
    else if (b.rfind("https://", 0) == 0) {
        throw std::runtime_error("https BASE_URL not supported by test client; use http://HOST:PORT");
    } else pos = 0;
    std::string hostport = b.substr(pos);
    size_t slash = hostport.find('/');
    if (slash != std::string::npos) hostport = hostport.substr(0, slash);
    size_t colon = hostport.rfind(':');
    if (colon == std::string::npos) return {hostport, std::string("80")};
    std::string host = hostport.substr(0, colon);
    std::string port = hostport.substr(colon + 1);
    if (host.empty()) host = "127.0.0.1";
    if (port.empty()) port = "80";
    return {host, port};
}

static inline http::verb verb_for(const std::string& method) {
    if (method == "POST") return http::verb::post;
    if (method == "PUT") return http::verb::put;
    if (method == "DELETE") return http::verb::delete_;
    if (method == "PATCH") return http::verb::patch;
    if (method == "OPTIONS") return http::verb::options;
    return http::verb::get;
}

// One request on a fresh connection; the full response is returned.
static inline http::response<http::string_body> send_request(const std::string& method, const std::string& target, const std::string& body = "") {
    auto [host, port] = parse_base_url();
    asio::io_context ioc;
    asio::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    const auto op_timeout = std::chrono::seconds(5);
    beast::error_code ec;
    auto const results = resolver.resolve(host, port, ec);
    if (ec) throw std::runtime_error("resolve failed for " + host + ":" + port + " -> " + ec.message());
    stream.expires_after(op_timeout);
    stream.connect(results, ec);
    if (ec) throw std::runtime_error("connect failed " + host + ":" + port + " -> " + ec.message());

    http::request<http::string_body> req{verb_for(method), target, 11};
    req.set(http::field::host, host);
    if (!body.empty()) req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();

    stream.expires_after(op_timeout);
    http::write(stream, req, ec);
    if (ec) throw std::runtime_error("write failed target=" + target + " -> " + ec.message());

    beast::flat_buffer b;
    http::response<http::string_body> res;
    stream.expires_after(op_timeout);
    http::read(stream, b, res, ec);
    if (ec) throw std::runtime_error("read failed target=" + target + " -> " + ec.message());
    beast::error_code shut_ec;
    stream.socket().shutdown(asio::ip::tcp::socket::shutdown_both, shut_ec);
    return res;
}

static inline std::pair<int,std::string> request(const std::string& method, const std::string& target, const std::string& body = "") {
    auto res = send_request(method, target, body);
    return {res.result_int(), res.body()};
}

static inline std::pair<int,std::string> post_json(const std::string& target, const std::string& body) { return request("POST", target, body); }
static inline std::pair<int,std::string> get(const std::string& target) { return request("GET", target); }

// Raw socket read until the server closes; false on timeout.
static inline bool read_until_eof(asio::ip::tcp::socket& sock, std::string& out, int timeout_ms = 2000) {
    boost::system::error_code ec;
    sock.non_blocking(true, ec);
    auto start = std::chrono::steady_clock::now();
    for (;;) {
        char buf[1024];
        boost::system::error_code recv_ec;
        std::size_t n = sock.read_some(asio::buffer(buf), recv_ec);
        if (recv_ec) {
            if (recv_ec == asio::error::eof || recv_ec == asio::error::connection_reset) {
                out.append(buf, n);
                return true;
            }
            if (recv_ec == asio::error::would_block || recv_ec == asio::error::try_again) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                if (std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count() > timeout_ms) return false;
                continue;
            }
            return false;
        }
        out.append(buf, n);
    }
}

// minimal JSON escape for constructing payloads
static inline std::string json_escape(const std::string& s) {
    std::string out; out.reserve(s.size()+4);
    for (char c : s) {
        if (c == '"') { out.push_back('\\'); out.push_back('"'); }
        else if (c == '\\') { out.push_back('\\'); out.push_back('\\'); }
        else if (c == '\n') { out.push_back('\\'); out.push_back('n'); }
        else out.push_back(c);
    }
    return out;
}
