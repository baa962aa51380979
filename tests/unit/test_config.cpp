#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace Relay::Core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_env();
    }
    void TearDown() override {
        clear_env();
    }

    static void clear_env() {
        unsetenv(Constants::ENV_ORIGINS);
        unsetenv(Constants::ENV_TIMEOUT_MS);
        unsetenv(Constants::ENV_RANDOM);
        unsetenv(Constants::ENV_BIND_IP);
        unsetenv(Constants::ENV_BIND_PORT);
    }
};

TEST_F(ConfigTest, Defaults) {
    char* argv[] = {(char*)"relay"};
    auto  config = Config::parse(1, argv);

    EXPECT_TRUE(config.origins.empty());
    EXPECT_EQ(config.timeout_ms, 500);
    EXPECT_FALSE(config.random);
    EXPECT_EQ(config.bind_ip, "127.0.0.1");
    EXPECT_EQ(config.bind_port, 8080);
    EXPECT_EQ(config.max_body_bytes, Constants::DEFAULT_MAX_BODY_BYTES);
    EXPECT_EQ(config.max_response_bytes, Constants::DEFAULT_MAX_RESPONSE_BYTES);
    ASSERT_EQ(config.success_statuses.size(), 1u);
    EXPECT_EQ(config.success_statuses[0], 200u);
}

TEST_F(ConfigTest, EnvironmentSurface) {
    setenv(Constants::ENV_ORIGINS, "a.internal:8080, b.internal ,c.internal:81", 1);
    setenv(Constants::ENV_TIMEOUT_MS, "250", 1);
    setenv(Constants::ENV_RANDOM, "true", 1);

    char* argv[] = {(char*)"relay"};
    auto  config = Config::parse(1, argv);

    ASSERT_EQ(config.origins.size(), 3u);
    EXPECT_EQ(config.origins[0], "a.internal:8080");
    EXPECT_EQ(config.origins[1], "b.internal");
    EXPECT_EQ(config.origins[2], "c.internal:81");
    EXPECT_EQ(config.timeout_ms, 250);
    EXPECT_TRUE(config.random);
}

TEST_F(ConfigTest, NonNumericTimeoutFallsBackToDefault) {
    setenv(Constants::ENV_TIMEOUT_MS, "fast", 1);
    char* argv[] = {(char*)"relay"};
    EXPECT_EQ(Config::parse(1, argv).timeout_ms, 500);

    setenv(Constants::ENV_TIMEOUT_MS, "0", 1);
    EXPECT_EQ(Config::parse(1, argv).timeout_ms, 500);
}

TEST_F(ConfigTest, OutOfRangeEnvNumbersFallBack) {
    setenv(Constants::ENV_TIMEOUT_MS, "99999999999", 1);
    setenv(Constants::ENV_BIND_PORT, "70000", 1);
    char* argv[] = {(char*)"relay"};
    auto  config = Config::parse(1, argv);

    EXPECT_EQ(config.timeout_ms, 500);
    EXPECT_EQ(config.bind_port, 8080);

    setenv(Constants::ENV_TIMEOUT_MS, "2147483647", 1);
    setenv(Constants::ENV_BIND_PORT, "0", 1);
    config = Config::parse(1, argv);
    EXPECT_EQ(config.timeout_ms, 2147483647);
    EXPECT_EQ(config.bind_port, 0);
}

TEST_F(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"relay",
                    (char*)"--origins",
                    (char*)"a:81,b:82",
                    (char*)"-o",
                    (char*)"c:83",
                    (char*)"--timeout",
                    (char*)"750",
                    (char*)"--random",
                    (char*)"--port",
                    (char*)"9000",
                    (char*)"--success-status",
                    (char*)"200,204"};
    auto  config = Config::parse(12, argv);

    ASSERT_EQ(config.origins.size(), 3u);
    EXPECT_EQ(config.origins[2], "c:83");
    EXPECT_EQ(config.timeout_ms, 750);
    EXPECT_TRUE(config.random);
    EXPECT_EQ(config.bind_port, 9000);
    EXPECT_EQ(config.success_statuses.size(), 2u);
}

TEST_F(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        origins:
          - "10.0.0.1:8080"
          - "10.0.0.2:8080"
        timeout_ms: 300
        random: true
        bind_ip: "0.0.0.0"
        bind_port: 8181
        threads: 8
        body_timeout_ms: 2000
        max_response_bytes: 1048576
        success_statuses: [200, 201]
        log_level: debug
    )";
    std::ofstream ofs("test_relay.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"relay", (char*)"--config", (char*)"test_relay.yaml"};
    auto  config = Config::parse(3, argv);

    ASSERT_EQ(config.origins.size(), 2u);
    EXPECT_EQ(config.origins[1], "10.0.0.2:8080");
    EXPECT_EQ(config.timeout_ms, 300);
    EXPECT_TRUE(config.random);
    EXPECT_EQ(config.bind_ip, "0.0.0.0");
    EXPECT_EQ(config.bind_port, 8181);
    EXPECT_EQ(config.threads, 8);
    EXPECT_EQ(config.body_timeout_ms, 2000);
    EXPECT_EQ(config.max_response_bytes, 1048576u);
    EXPECT_EQ(config.success_statuses.size(), 2u);
    EXPECT_EQ(config.log_level, "debug");

    std::remove("test_relay.yaml");
}

TEST_F(ConfigTest, YamlCommaStringOrigins) {
    std::ofstream ofs("test_relay_csv.yaml");
    ofs << "origins: \"a:1, b:2\"\n";
    ofs.close();

    char* argv[] = {(char*)"relay", (char*)"--config", (char*)"test_relay_csv.yaml"};
    auto  config = Config::parse(3, argv);
    ASSERT_EQ(config.origins.size(), 2u);
    EXPECT_EQ(config.origins[1], "b:2");

    std::remove("test_relay_csv.yaml");
}

TEST_F(ConfigTest, PrecedenceEnvThenYamlThenCli) {
    setenv(Constants::ENV_TIMEOUT_MS, "100", 1);
    setenv(Constants::ENV_ORIGINS, "env-origin", 1);

    std::ofstream ofs("test_ovr.yaml");
    ofs << "timeout_ms: 200\norigins: [yaml-origin]";
    ofs.close();

    char* argv[] = {
        (char*)"relay", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--timeout", (char*)"300"};
    auto config = Config::parse(5, argv);

    EXPECT_EQ(config.timeout_ms, 300);
    ASSERT_EQ(config.origins.size(), 1u);
    EXPECT_EQ(config.origins[0], "yaml-origin");

    std::remove("test_ovr.yaml");
}

TEST_F(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "timeout_ms: [not an integer]";
    ofs.close();

    const char* argv[] = {"relay", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST_F(ConfigTest, NonExistentFile) {
    const char* argv[] = {"relay", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST_F(ConfigTest, EmptyConfigKeepsDefaults) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"relay", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.timeout_ms, 500);
    EXPECT_FALSE(config.random);

    std::remove("empty.yaml");
}
