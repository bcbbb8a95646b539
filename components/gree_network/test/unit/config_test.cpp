#include "gree_network/config.hpp"
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace gree_network;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string writeFile(const std::string& contents) {
        path_ = ::testing::TempDir() + "gree_config_test.json";
        std::ofstream file(path_);
        file << contents;
        return path_;
    }

    std::string path_;
};

TEST_F(ConfigTest, DefaultsWhenSectionAbsent) {
    auto config = ConfigLoader::parseClientConfig(nlohmann::json::object());

    EXPECT_EQ(7000, config.devicePort);
    EXPECT_EQ("app", config.clientId);
    EXPECT_EQ("a3K8Bx%2r8Y7#xDh", config.genericKey);
    EXPECT_EQ(std::chrono::milliseconds(5000), config.bindTimeout);
    EXPECT_EQ(std::chrono::milliseconds(5000), config.requestTimeout);
    EXPECT_EQ(std::chrono::milliseconds(2000), config.discoveryWindow);
    EXPECT_EQ(65507u, config.maxDatagramSize);
    EXPECT_TRUE(config.broadcastAddresses.empty());
}

TEST_F(ConfigTest, ParsesClientSection) {
    nlohmann::json json = {
        {"client", {
            {"devicePort", 7001},
            {"clientId", "tool"},
            {"bindTimeoutMs", 1500},
            {"requestTimeoutMs", 2500},
            {"discoveryWindowMs", 800},
            {"maxDatagramSize", 4096},
            {"broadcastAddresses", {"192.168.1.255", "10.0.0.255"}},
            {"unknownKey", true}
        }}
    };

    auto config = ConfigLoader::parseClientConfig(json);

    EXPECT_EQ(7001, config.devicePort);
    EXPECT_EQ("tool", config.clientId);
    EXPECT_EQ("a3K8Bx%2r8Y7#xDh", config.genericKey);
    EXPECT_EQ(std::chrono::milliseconds(1500), config.bindTimeout);
    EXPECT_EQ(std::chrono::milliseconds(2500), config.requestTimeout);
    EXPECT_EQ(std::chrono::milliseconds(800), config.discoveryWindow);
    EXPECT_EQ(4096u, config.maxDatagramSize);
    EXPECT_EQ((std::vector<std::string>{"192.168.1.255", "10.0.0.255"}), config.broadcastAddresses);
}

TEST_F(ConfigTest, WrongTypeIsRejected) {
    nlohmann::json json = {{"client", {{"bindTimeoutMs", "soon"}}}};
    EXPECT_THROW(ConfigLoader::parseClientConfig(json), std::runtime_error);

    nlohmann::json logging = {{"logging", {{"level", 3}}}};
    EXPECT_THROW(ConfigLoader::parseLoggingConfig(logging), std::runtime_error);
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto path = writeFile(R"({
        "client": {"devicePort": 7002, "requestTimeoutMs": 900},
        "logging": {"level": "debug", "file": "/tmp/gree.log"}
    })");

    auto client = ConfigLoader::loadClientConfig(path);
    EXPECT_EQ(7002, client.devicePort);
    EXPECT_EQ(std::chrono::milliseconds(900), client.requestTimeout);

    auto logging = ConfigLoader::loadLoggingConfig(path);
    EXPECT_EQ("debug", logging.level);
    EXPECT_EQ("/tmp/gree.log", logging.file);
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(ConfigLoader::loadClientConfig("/nonexistent/gree.json"), std::runtime_error);
}

TEST_F(ConfigTest, MalformedFileThrows) {
    auto path = writeFile("{ not json");
    EXPECT_THROW(ConfigLoader::loadClientConfig(path), std::runtime_error);
}

TEST_F(ConfigTest, ZeroDatagramSizeIsRejected) {
    nlohmann::json json = {{"client", {{"maxDatagramSize", 0}}}};
    EXPECT_THROW(ConfigLoader::parseClientConfig(json), std::runtime_error);
}
