#include <gtest/gtest.h>
#include <cstdlib>
#include "larder/config.hpp"
#include "larder/errors.hpp"

using namespace larder;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        unsetenv("PORT");
        unsetenv("LARDER_DATA_DIR");
        unsetenv("LARDER_BIND_ADDRESS");
    }
};

TEST_F(ConfigTest, Load_WithoutEnvironment_ShouldUseDefaults) {
    char program[] = "larder_server";
    char* argv[] = {program};

    auto config = Config::load(1, argv);

    EXPECT_EQ(config.port, DEFAULT_PORT);
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.data_dir, std::filesystem::path(DEFAULT_DATA_DIR));
    EXPECT_EQ(config.server_address(), "0.0.0.0:50051");
}

TEST_F(ConfigTest, Load_WithEnvironment_ShouldOverrideDefaults) {
    setenv("PORT", "6000", 1);
    setenv("LARDER_DATA_DIR", "/var/lib/larder", 1);
    setenv("LARDER_BIND_ADDRESS", "127.0.0.1", 1);
    char program[] = "larder_server";
    char* argv[] = {program};

    auto config = Config::load(1, argv);

    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.data_dir, std::filesystem::path("/var/lib/larder"));
    EXPECT_EQ(config.server_address(), "127.0.0.1:6000");
}

TEST_F(ConfigTest, Load_WithPortArgument_ShouldWinOverEnvironment) {
    setenv("PORT", "6000", 1);
    char program[] = "larder_server";
    char port[] = "7001";
    char* argv[] = {program, port};

    EXPECT_EQ(Config::load(2, argv).port, 7001);
}

TEST_F(ConfigTest, Load_WithMalformedPort_ShouldThrowConfigError) {
    setenv("PORT", "http", 1);
    char program[] = "larder_server";
    char* argv[] = {program};

    EXPECT_THROW(Config::load(1, argv), ConfigError);
}

TEST(ParsePortTest, OutOfRangeOrTrailingText_ShouldThrowConfigError) {
    EXPECT_EQ(parse_port("1"), 1);
    EXPECT_EQ(parse_port("65535"), 65535);
    EXPECT_THROW(parse_port("0"), ConfigError);
    EXPECT_THROW(parse_port("65536"), ConfigError);
    EXPECT_THROW(parse_port("80x"), ConfigError);
    EXPECT_THROW(parse_port(""), ConfigError);
}
