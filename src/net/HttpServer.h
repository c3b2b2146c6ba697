#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include "Router.h"
#include <string>

class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port, Router& router, bool metrics_enabled, bool access_log, std::string cors_allow_origin = "*");
    void run();
    void stop();
    // Actual bound port; differs from the requested one when that was 0.
    unsigned short local_port() const;
private:
    void do_accept();
    boost::asio::io_context& ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Router& router_;
    bool metrics_enabled_;
    bool access_log_;
    std::string cors_allow_origin_;
};
