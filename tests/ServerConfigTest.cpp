#include "raptor/config/ServerConfig.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace raptor;

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnvironment(); }
    void TearDown() override { clearEnvironment(); }

    static void clearEnvironment() {
        for (const char* name : {"RAPTOR_HOST", "RAPTOR_PORT", "RAPTOR_VIEWS", "RAPTOR_IO_THREADS", "RAPTOR_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ServerConfigTest, DefaultsAreUsable) {
    auto settings = config::defaultServerConfig();
    EXPECT_EQ(settings.host, "0.0.0.0");
    EXPECT_EQ(settings.port, 8080);
    EXPECT_EQ(settings.viewsRoot, "views");
    EXPECT_GE(settings.ioThreads, 2u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::info);
}

TEST_F(ServerConfigTest, JsonOverlaysPresentKeys) {
    auto settings = config::defaultServerConfig();
    config::applyJson(settings, boost::json::object{{"port", 9090}, {"views", "/srv/views"}, {"logLevel", "debug"}});
    EXPECT_EQ(settings.host, "0.0.0.0");
    EXPECT_EQ(settings.port, 9090);
    EXPECT_EQ(settings.viewsRoot, "/srv/views");
    EXPECT_EQ(settings.logLevel, util::LogLevel::debug);
}

TEST_F(ServerConfigTest, InvalidJsonValuesAreIgnored) {
    auto settings = config::defaultServerConfig();
    config::applyJson(settings, boost::json::object{{"port", 70000}, {"host", 5}, {"ioThreads", -1}});
    EXPECT_EQ(settings.port, 8080);
    EXPECT_EQ(settings.host, "0.0.0.0");
    EXPECT_GE(settings.ioThreads, 2u);
}

TEST_F(ServerConfigTest, OversizedThreadCountsAreRejected) {
    auto settings = config::defaultServerConfig();
    const auto defaults = settings.ioThreads;
    config::applyJson(settings, boost::json::object{{"ioThreads", std::int64_t{4294967298}}});
    EXPECT_EQ(settings.ioThreads, defaults);

    config::applyJson(settings, boost::json::object{{"ioThreads", static_cast<std::int64_t>(config::kMaxIoThreads)}});
    EXPECT_EQ(settings.ioThreads, config::kMaxIoThreads);
}

TEST_F(ServerConfigTest, EnvironmentNumbersMustBeWholeAndInRange) {
    ::setenv("RAPTOR_IO_THREADS", "4294967298", 1);
    ::setenv("RAPTOR_PORT", "80abc", 1);
    auto settings = config::defaultServerConfig();
    const auto defaults = settings.ioThreads;
    config::applyEnvironment(settings);
    EXPECT_EQ(settings.ioThreads, defaults);
    EXPECT_EQ(settings.port, 8080);

    ::setenv("RAPTOR_IO_THREADS", "0", 1);
    ::setenv("RAPTOR_PORT", "99999", 1);
    config::applyEnvironment(settings);
    EXPECT_EQ(settings.ioThreads, defaults);
    EXPECT_EQ(settings.port, 8080);

    ::setenv("RAPTOR_IO_THREADS", "4", 1);
    config::applyEnvironment(settings);
    EXPECT_EQ(settings.ioThreads, 4u);
}

TEST_F(ServerConfigTest, MissingFileGivesDefaults) {
    auto settings = config::loadServerConfig("/nonexistent/raptor.json");
    EXPECT_EQ(settings.port, 8080);
}

TEST_F(ServerConfigTest, FileThenEnvironment) {
    auto path = std::filesystem::temp_directory_path() / "raptor-config-test.json";
    std::ofstream(path) << R"({"host": "127.0.0.1", "port": 8181, "ioThreads": 3})";
    ::setenv("RAPTOR_PORT", "8282", 1);
    ::setenv("RAPTOR_LOG_LEVEL", "WARN", 1);

    auto settings = config::loadServerConfig(path);
    EXPECT_EQ(settings.host, "127.0.0.1");
    EXPECT_EQ(settings.port, 8282);
    EXPECT_EQ(settings.ioThreads, 3u);
    EXPECT_EQ(settings.logLevel, util::LogLevel::warn);

    std::filesystem::remove(path);
}

TEST_F(ServerConfigTest, MalformedFileIsIgnored) {
    auto path = std::filesystem::temp_directory_path() / "raptor-config-broken.json";
    std::ofstream(path) << "{ not json";
    auto settings = config::loadServerConfig(path);
    EXPECT_EQ(settings.port, 8080);
    std::filesystem::remove(path);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(util::parseLogLevel("TRACE"), util::LogLevel::trace);
    EXPECT_EQ(util::parseLogLevel("Debug"), util::LogLevel::debug);
    EXPECT_EQ(util::parseLogLevel("warning"), util::LogLevel::warn);
    EXPECT_EQ(util::parseLogLevel("error"), util::LogLevel::error);
    EXPECT_EQ(util::parseLogLevel("verbose"), util::LogLevel::info);
    EXPECT_STREQ(util::toString(util::LogLevel::warn), "WARN");
}
