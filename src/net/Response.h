#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "Request.h"

using Response = boost::beast::http::response<boost::beast::http::string_body>;

// JSON response with keep-alive mirrored from the request and the payload prepared.
Response make_json_response(boost::beast::http::status st, const Request& req, std::string body);
Response make_json_response(boost::beast::http::status st, unsigned version, bool keep_alive, std::string body);
