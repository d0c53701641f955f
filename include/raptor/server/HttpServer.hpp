#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace raptor::routing {
class Application;
}

namespace raptor::server {

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io,
               std::shared_ptr<const routing::Application> app,
               std::string host,
               unsigned short port);

    void start();
    void stop();

    // Bound port after start(); differs from the configured one when that was 0.
    unsigned short localPort() const;

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<const routing::Application> app_;
    std::string host_;
    unsigned short port_{};
    std::atomic<bool> running_{false};
};

} // namespace raptor::server
