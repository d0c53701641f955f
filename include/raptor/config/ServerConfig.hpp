#pragma once

#include "raptor/util/Logging.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace raptor::config {

inline constexpr unsigned int kMaxIoThreads = 256;

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::string viewsRoot{"views"};
    unsigned int ioThreads{2};
    util::LogLevel logLevel{util::LogLevel::info};
};

ServerConfig defaultServerConfig();

// Overlays the keys present in json: host, port, views, ioThreads, logLevel.
void applyJson(ServerConfig& config, const boost::json::object& json);

// RAPTOR_HOST, RAPTOR_PORT, RAPTOR_VIEWS, RAPTOR_IO_THREADS, RAPTOR_LOG_LEVEL
void applyEnvironment(ServerConfig& config);

// Defaults, then the JSON file if it exists, then the environment.
ServerConfig loadServerConfig(const std::filesystem::path& path);

} // namespace raptor::config
