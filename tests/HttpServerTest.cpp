#include "TestResources.hpp"

#include "raptor/routing/Application.hpp"
#include "raptor/routing/RouteTable.hpp"
#include "raptor/server/HttpServer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace raptor;
namespace http = boost::beast::http;

namespace {

std::shared_ptr<const routing::Application> widgetApp() {
    std::vector<std::shared_ptr<const routing::Router>> routers{
        routing::routes<test::Widgets>(std::make_shared<test::RecordingTemplateEngine>(),
                                       [](routing::RouteTableBuilder& r) { r.show(); })};
    return std::make_shared<routing::Application>(std::move(routers));
}

http::response<http::string_body> get(unsigned short port, const std::string& target) {
    boost::asio::io_context io;
    boost::beast::tcp_stream stream(io);
    stream.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));

    http::request<http::empty_body> request{http::verb::get, target, 11};
    request.set(http::field::host, "127.0.0.1");
    request.keep_alive(false);
    http::write(stream, request);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response);

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return response;
}

} // namespace

TEST(HttpServerTest, ServesRequestsAndStopsFromAnotherThread) {
    boost::asio::io_context io;
    auto server = std::make_shared<server::HttpServer>(io, widgetApp(), "127.0.0.1", 0);
    server->start();
    const auto port = server->localPort();
    ASSERT_NE(port, 0);

    std::vector<std::thread> ioThreads;
    for (int i = 0; i < 2; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    auto ok = get(port, "/widgets/7");
    EXPECT_EQ(ok.result(), http::status::ok);
    EXPECT_EQ(ok.body(), R"(widgets/show:{"presenter":"one","id":7,"label":"widget 7"})");

    auto missing = get(port, "/nowhere");
    EXPECT_EQ(missing.result(), http::status::not_found);

    // Stopping twice is harmless; once the acceptor closes, the io threads run out of work.
    server->stop();
    server->stop();
    for (auto& thread : ioThreads) {
        thread.join();
    }
    EXPECT_TRUE(io.stopped());
}
