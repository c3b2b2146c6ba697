#include "HttpServer.h"
#include "Request.h"
#include "Response.h"
#include "ReadDeadline.h"
#include "observability/Metrics.h"
#include "observability/Logging.h"
#include <boost/beast/http.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

static constexpr std::size_t kHeaderLimit = 8 * 1024;
static constexpr std::size_t kBodyLimit = 1 * 1024 * 1024;

struct Session : std::enable_shared_from_this<Session> {
    net::ip::tcp::socket socket;
    beast::flat_buffer buffer;
    net::steady_timer read_timer;
    Router& router;
    unsigned http_version = 11;
    Request req;
    bool draining_ = false;
    std::array<char, 4096> drain_buf_{};
    int drain_seconds_ = 5;
    ReadDeadline deadline_;
    std::chrono::steady_clock::time_point start_ts;
    bool metrics_enabled;
    bool access_log;
    std::string cors_allow_origin;

    Session(net::ip::tcp::socket&& s, Router& r, bool me, bool al, std::string cors)
        : socket(std::move(s)), buffer(), read_timer(socket.get_executor()), router(r), metrics_enabled(me), access_log(al), cors_allow_origin(std::move(cors)) {}

    void run() { do_read(); }

    void do_read() {
        auto self = shared_from_this();
        req = {};
        http_version = 11;

        auto parser = std::make_shared<http::request_parser<http::string_body>>();
        parser->header_limit(kHeaderLimit);
        parser->body_limit(kBodyLimit);

        // idle keep-alive connections and slow headers both end here
        const unsigned header_gen = deadline_.arm();
        read_timer.expires_after(std::chrono::seconds(5));
        read_timer.async_wait([self, header_gen](const boost::system::error_code& ec) {
            if (!ec && self->deadline_.current(header_gen)) self->close_socket();
        });

        http::async_read_header(socket, buffer, *parser, [self, parser](beast::error_code ec, std::size_t) {
            self->deadline_.finish();
            boost::system::error_code ignored_cancel; self->read_timer.cancel(ignored_cancel);
            self->start_ts = std::chrono::steady_clock::now();

            if (ec) {
                if (ec == http::error::end_of_stream) {
                    self->close_socket();
                    return;
                }
                if (ec == http::error::header_limit) {
                    self->reply_json_error(http::status::request_header_fields_too_large, "{\"error\":\"header too large\"}", true, "(header)");
                    return;
                }
                if (ec == http::error::bad_target || ec == http::error::bad_method || ec == http::error::bad_version ||
                    ec == http::error::bad_field || ec == http::error::bad_value) {
                    self->reply_json_error(http::status::bad_request, "{\"error\":\"bad request\"}", true, "(parse)");
                    return;
                }
                self->close_socket();
                return;
            }

            auto& hdr_req = parser->get();
            self->http_version = hdr_req.version();
            auto content_len = parser->content_length();
            std::size_t len = content_len ? static_cast<std::size_t>(*content_len) : 0;
            if (len > kBodyLimit) {
                observability::log_info("oversized_body_header", {{"len", int64_t(len)}});
                self->drain_seconds_ = std::min(10, std::max(5, int(len / (256 * 1024))));
                self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body too large\"}", true, "(body)");
                return;
            }

            if (len == 0) self->read_timer.expires_after(std::chrono::seconds(10));
            else if (len <= 128*1024) self->read_timer.expires_after(std::chrono::seconds(20));
            else self->read_timer.expires_after(std::chrono::seconds(60));
            const unsigned body_gen = self->deadline_.arm();
            self->read_timer.async_wait([self, body_gen](const boost::system::error_code& ec2) {
                if (!ec2 && self->deadline_.current(body_gen)) self->close_socket();
            });

            http::async_read(self->socket, self->buffer, *parser, [self, parser](beast::error_code ec2, std::size_t) {
                self->deadline_.finish();
                boost::system::error_code ignored_cancel2; self->read_timer.cancel(ignored_cancel2);
                if (ec2) {
                    if (ec2 == http::error::body_limit) {
                        self->reply_json_error(http::status::payload_too_large, "{\"error\":\"body too large\"}", true, "(body)");
                        return;
                    }
                    self->close_socket();
                    return;
                }
                self->req = parser->release();
                self->handle_request();
            });
        });
    }

    void handle_request() {
        auto self = shared_from_this();
        if (req.method() == http::verb::options) {
            auto res = std::make_shared<Response>(http::status::no_content, req.version());
            res->set(http::field::access_control_allow_methods, "GET, POST, PUT, DELETE, OPTIONS");
            res->set(http::field::access_control_allow_headers, "Content-Type");
            res->set(http::field::access_control_max_age, "600");
            res->keep_alive(req.keep_alive());
            res->prepare_payload();
            send_response(res, "(preflight)");
            return;
        }

        std::string label = router.label_for(req);
        router.dispatch(req, [self, label](Response res) {
            self->send_response(std::make_shared<Response>(std::move(res)), label);
        });
    }

    void send_response(std::shared_ptr<Response> sp, const std::string& label) {
        auto self = shared_from_this();
        if (sp->find(http::field::connection) == sp->end()) {
            sp->keep_alive(req.keep_alive());
        }
        sp->set(http::field::access_control_allow_origin, cors_allow_origin);

        http::async_write(socket, *sp, [self, sp, label](boost::system::error_code ec, std::size_t) {
            self->observe(*sp, label);
            if (ec) {
                observability::log_warn("write_error", {{"path", label}, {"err", ec.message()}});
                self->close_socket();
                return;
            }
            if (sp->keep_alive()) {
                self->do_read();
            } else {
                self->graceful_close_after_write();
            }
        });
    }

    void observe(const Response& res, const std::string& label) {
        double dur_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_ts).count();
        std::string method = req.method_string().empty() ? std::string("-") : std::string(req.method_string());
        if (metrics_enabled) {
            observability::Metrics::instance().record(label, method, res.result_int(), dur_ms);
        }
        if (access_log) {
            observability::log_info("access", {
                {"method", method},
                {"path", std::string(req.target())},
                {"route", label},
                {"status", int64_t(res.result_int())},
                {"dur_ms", dur_ms}});
        }
    }

    void close_socket(bool hard_shutdown = true) {
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        socket.cancel(ignored);
        if (hard_shutdown) socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);
    }

    void start_drain_timer() {
        auto self = shared_from_this();
        boost::system::error_code ignored;
        read_timer.cancel(ignored);
        read_timer.expires_after(std::chrono::seconds(drain_seconds_));
        read_timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec) return;
            self->close_socket(false);
        });
    }

    // Reads and discards until the peer closes, so it sees our response
    // instead of a reset caused by unread request bytes.
    void do_drain_read() {
        auto self = shared_from_this();
        socket.async_read_some(net::buffer(drain_buf_), [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                if (ec == net::error::operation_aborted) return;
                boost::system::error_code ignored;
                self->read_timer.cancel(ignored);
                self->close_socket(false);
                return;
            }
            self->do_drain_read();
        });
    }

    void graceful_close_after_write() {
        if (draining_) return;
        draining_ = true;
        boost::system::error_code ignored;
        socket.shutdown(net::ip::tcp::socket::shutdown_send, ignored);
        start_drain_timer();
        do_drain_read();
    }

    void reply_json_error(http::status st, const std::string& body, bool close_conn, const std::string& label) {
        auto res = std::make_shared<Response>(st, http_version);
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->set(http::field::access_control_allow_origin, cors_allow_origin);
        res->body() = body;
        if (!close_conn) {
            send_response(res, label);
            return;
        }
        res->keep_alive(false);
        res->prepare_payload();
        http::async_write(socket, *res, [self = shared_from_this(), res, label](boost::system::error_code ec, std::size_t) {
            self->observe(*res, label);
            if (ec) {
                observability::log_warn("write_error", {{"path", label}, {"err", ec.message()}});
                self->close_socket();
                return;
            }
            self->graceful_close_after_write();
        });
    }
};

HttpServer::HttpServer(net::io_context& ioc, const std::string& address, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::string cors_allow_origin)
    : ioc_(ioc), acceptor_(ioc, net::ip::tcp::endpoint(net::ip::make_address(address), port)), router_(router), metrics_enabled_(metrics_enabled), access_log_(access_log), cors_allow_origin_(std::move(cors_allow_origin)) {}

void HttpServer::run() { do_accept(); }

void HttpServer::stop() {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
}

unsigned short HttpServer::local_port() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, net::ip::tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            auto s = std::make_shared<Session>(std::move(socket), router_, metrics_enabled_, access_log_, cors_allow_origin_);
            s->run();
        } else {
            observability::log_warn("accept_error", {{"err", ec.message()}});
        }
        do_accept();
    });
}
