#include "raptor/server/RequestHandler.hpp"
#include "raptor/core/Errors.hpp"
#include "raptor/server/RequestParser.hpp"
#include "raptor/util/JsonUtil.hpp"
#include "raptor/util/Logging.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <exception>
#include <string>

namespace raptor::server {
namespace {

namespace http = boost::beast::http;

void sendHtml(RequestContext& ctx, std::string body) {
    ctx.response.result(http::status::ok);
    ctx.response.set(http::field::content_type, "text/html; charset=utf-8");
    ctx.response.body() = std::move(body);
    ctx.response.prepare_payload();
}

void sendError(RequestContext& ctx, http::status status, const char* kind, const std::exception& ex) {
    boost::json::object payload{{"error", kind}, {"message", ex.what()}};
    ctx.response.result(status);
    ctx.response.set(http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(payload);
    ctx.response.prepare_payload();
}

} // namespace

void handleRequest(const routing::Application& app, RequestContext& ctx) {
    std::string contentType;
    if (auto header = ctx.request.find(http::field::content_type); header != ctx.request.end()) {
        contentType = std::string(header->value());
    }
    ctx.routed = buildRequest(std::string_view(ctx.request.target().data(), ctx.request.target().size()),
                              ctx.request.body(),
                              contentType);

    try {
        sendHtml(ctx, app.call(ctx.routed));
    } catch (const NoRouteMatches& ex) {
        sendError(ctx, http::status::not_found, "no_route_matches", ex);
    } catch (const MissingArgument& ex) {
        util::log(util::LogLevel::warn, ctx.routed.path + ": " + ex.what());
        sendError(ctx, http::status::bad_request, "missing_argument", ex);
    } catch (const InvalidPathArgument& ex) {
        util::log(util::LogLevel::warn, ctx.routed.path + ": " + ex.what());
        sendError(ctx, http::status::bad_request, "invalid_path_argument", ex);
    } catch (const InvalidArgumentType& ex) {
        util::log(util::LogLevel::warn, ctx.routed.path + ": " + ex.what());
        sendError(ctx, http::status::bad_request, "invalid_argument_type", ex);
    } catch (const RoutingError& ex) {
        util::log(util::LogLevel::error, ctx.routed.path + ": " + ex.what());
        sendError(ctx, http::status::internal_server_error, "routing_error", ex);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, ctx.routed.path + ": handler failed: " + ex.what());
        sendError(ctx, http::status::internal_server_error, "handler_failure", ex);
    }
}

} // namespace raptor::server
