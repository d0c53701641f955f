#include "raptor/server/HttpServer.hpp"
#include "raptor/routing/Application.hpp"
#include "raptor/server/RequestContext.hpp"
#include "raptor/server/RequestHandler.hpp"
#include "raptor/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace raptor::server {
namespace {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const routing::Application> app)
        : stream_(std::move(socket)), app_(std::move(app)) {}

    void start() { readRequest(); }

private:
    void readRequest() {
        request_ = {};
        boost::beast::http::async_read(stream_, buffer_, request_,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                if (ec == boost::beast::http::error::end_of_stream) {
                    self->doClose();
                    return;
                }
                if (ec) {
                    util::log(util::LogLevel::debug, std::string{"read failed: "} + ec.message());
                    self->doClose();
                    return;
                }
                self->dispatch();
            }));
    }

    void dispatch() {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = std::move(request_);
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());
        ctx.response.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);

        handleRequest(*app_, ctx);
        logRequest(ctx);

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        boost::beast::http::async_write(stream_, *response,
            boost::asio::bind_executor(stream_.get_executor(),
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    self->doClose();
                    return;
                }
                if (!response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            }));
    }

    void logRequest(const RequestContext& ctx) const {
        if (!util::shouldLog(util::LogLevel::info)) {
            return;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::info,
                  std::string(ctx.request.method_string()) + " " + std::string(ctx.request.target()) +
                      " -> " + std::to_string(ctx.response.result_int()) + " (" +
                      std::to_string(elapsed.count() / 1000.0) + " ms)");
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        stream_.socket().close(ec);
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    RequestContext::HttpRequest request_;
    std::shared_ptr<const routing::Application> app_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io,
                       std::shared_ptr<const routing::Application> app,
                       std::string host,
                       unsigned short port)
    : io_(io)
    , acceptor_(boost::asio::make_strand(io))
    , app_(std::move(app))
    , host_(std::move(host))
    , port_(port) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(host_), port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    doAccept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // The acceptor is not thread-safe; close it on the executor its handlers run on.
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        boost::system::error_code ec;
        self->acceptor_.cancel(ec);
        self->acceptor_.close(ec);
    });
}

unsigned short HttpServer::localPort() const {
    return acceptor_.local_endpoint().port();
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }

            if (ec) {
                util::log(util::LogLevel::warn, std::string{"accept failed: "} + ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->app_)->start();
            }

            self->doAccept();
        });
}

} // namespace raptor::server
