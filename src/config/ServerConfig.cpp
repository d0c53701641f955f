#include "raptor/config/ServerConfig.hpp"
#include "raptor/util/JsonUtil.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <system_error>
#include <thread>

namespace raptor::config {
namespace {

// Whole-string unsigned parse within [1, max]; anything else is rejected.
std::optional<std::uint64_t> boundedValue(const char* text, std::uint64_t max) {
    std::uint64_t value = 0;
    const char* last = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, last, value);
    if (ec != std::errc{} || ptr != last || value == 0 || value > max) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ServerConfig defaultServerConfig() {
    ServerConfig config;
    config.ioThreads = std::max(2u, std::thread::hardware_concurrency());
    return config;
}

void applyJson(ServerConfig& config, const boost::json::object& json) {
    if (auto host = util::stringField(json, "host"); host && !host->empty()) config.host = *host;
    if (auto port = util::intField(json, "port"); port && *port > 0 && *port <= 65535) {
        config.port = static_cast<std::uint16_t>(*port);
    }
    if (auto views = util::stringField(json, "views"); views && !views->empty()) config.viewsRoot = *views;
    if (auto threads = util::intField(json, "ioThreads"); threads && *threads > 0 && *threads <= kMaxIoThreads) {
        config.ioThreads = static_cast<unsigned int>(*threads);
    }
    if (auto level = util::stringField(json, "logLevel")) config.logLevel = util::parseLogLevel(*level);
}

void applyEnvironment(ServerConfig& config) {
    if (const char* value = std::getenv("RAPTOR_HOST")) config.host = value;
    if (const char* value = std::getenv("RAPTOR_PORT")) {
        if (auto port = boundedValue(value, 65535)) {
            config.port = static_cast<std::uint16_t>(*port);
        }
    }
    if (const char* value = std::getenv("RAPTOR_VIEWS")) config.viewsRoot = value;
    if (const char* value = std::getenv("RAPTOR_IO_THREADS")) {
        if (auto threads = boundedValue(value, kMaxIoThreads)) {
            config.ioThreads = static_cast<unsigned int>(*threads);
        }
    }
    if (const char* value = std::getenv("RAPTOR_LOG_LEVEL")) config.logLevel = util::parseLogLevel(value);
}

ServerConfig loadServerConfig(const std::filesystem::path& path) {
    auto config = defaultServerConfig();
    try {
        if (auto json = util::loadJsonFile(path); json && json->is_object()) {
            applyJson(config, json->as_object());
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "ignoring config " + path.string() + ": " + ex.what());
    }
    applyEnvironment(config);
    return config;
}

} // namespace raptor::config
