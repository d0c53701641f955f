#pragma once

#include "raptor/core/Request.hpp"

#include <boost/beast/http.hpp>
#include <chrono>

namespace raptor::server {

struct RequestContext {
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    HttpRequest request;
    HttpResponse response;
    Request routed;
    std::chrono::steady_clock::time_point startedAt;
};

} // namespace raptor::server
