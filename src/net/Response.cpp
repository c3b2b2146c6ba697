#include "Response.h"

Response make_json_response(boost::beast::http::status st, unsigned version, bool keep_alive, std::string body) {
    Response res{st, version};
    res.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res.keep_alive(keep_alive);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response make_json_response(boost::beast::http::status st, const Request& req, std::string body) {
    return make_json_response(st, req.version(), req.keep_alive(), std::move(body));
}
