#include "raptor/config/ServerConfig.hpp"
#include "raptor/routing/Application.hpp"
#include "raptor/sample/Resources.hpp"
#include "raptor/server/HttpServer.hpp"
#include "raptor/util/Logging.hpp"
#include "raptor/view/TemplateEngine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace raptor;

    std::filesystem::path configPath = argc > 1 ? argv[1] : "config/raptor.json";
    auto settings = config::loadServerConfig(configPath);
    util::initLogging(settings.logLevel);

    std::shared_ptr<const routing::Application> app;
    try {
        auto engine = std::make_shared<view::FileTemplateEngine>(settings.viewsRoot);
        app = std::make_shared<routing::Application>(sample::blogRoutes(engine));
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"route table rejected: "} + ex.what());
        return 1;
    }

    boost::asio::io_context io;
    auto server = std::make_shared<server::HttpServer>(io, app, settings.host, settings.port);
    try {
        server->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"cannot listen on "} + settings.host + ":" +
                                             std::to_string(settings.port) + ": " + ex.what());
        return 1;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&io, server](const boost::system::error_code& ec, int) {
        if (!ec) {
            util::log(util::LogLevel::info, "shutting down");
            server->stop();
            io.stop();
        }
    });

    std::vector<std::thread> ioThreads;
    if (settings.ioThreads > 1) {
        ioThreads.reserve(settings.ioThreads - 1);
        for (unsigned int i = 0; i < settings.ioThreads - 1; ++i) {
            ioThreads.emplace_back([&io]() { io.run(); });
        }
    }

    util::log(util::LogLevel::info,
              "raptor listening on " + settings.host + ":" + std::to_string(settings.port) +
                  " (views: " + settings.viewsRoot + ")");
    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    return 0;
}
