#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "flycam/config.hpp"

using flycam::Config;
using flycam::ParseConfig;

namespace {
// Keeps the backend/verbose environment out of the way of each test.
class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv("FLYCAM_BACKEND");
    unsetenv("FLYCAM_VERBOSE");
  }
  void TearDown() override { SetUp(); }
};
}  // namespace

TEST_F(ConfigTest, Defaults) {
  const Config cfg = ParseConfig(std::vector<std::string>{});
  EXPECT_EQ(cfg.title, "flycam");
  EXPECT_EQ(cfg.width, 800u);
  EXPECT_EQ(cfg.height, 600u);
  EXPECT_FLOAT_EQ(cfg.speed, 0.2f);
  EXPECT_FALSE(cfg.texture_path.has_value());
  EXPECT_TRUE(cfg.backend.empty());
  EXPECT_FALSE(cfg.verbose);
  EXPECT_FALSE(cfg.show_help);
}

TEST_F(ConfigTest, ParsesOptionsAndTexture) {
  const Config cfg =
      ParseConfig(std::vector<std::string>{"--speed", "0.5", "--size", "1024x768", "tree.png"});
  EXPECT_FLOAT_EQ(cfg.speed, 0.5f);
  EXPECT_EQ(cfg.width, 1024u);
  EXPECT_EQ(cfg.height, 768u);
  ASSERT_TRUE(cfg.texture_path.has_value());
  EXPECT_EQ(cfg.texture_path->string(), "tree.png");
}

TEST_F(ConfigTest, Help) {
  EXPECT_TRUE(ParseConfig(std::vector<std::string>{"--help"}).show_help);
  EXPECT_TRUE(ParseConfig(std::vector<std::string>{"-h"}).show_help);
}

TEST_F(ConfigTest, RejectsBadSpeed) {
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed", "fast"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed", "0"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed", "-1"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed", "0.2x"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--speed", "1e999"}), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsBadSize) {
  for (const char* bad : {"800", "x600", "800x", "0x600", "800x-1", "99999x10", "axb",
                          "99999999999999999999x1", "1x99999999999999999999"}) {
    EXPECT_THROW(ParseConfig(std::vector<std::string>{"--size", bad}), std::invalid_argument)
        << bad;
  }
}

TEST_F(ConfigTest, RejectsUnknownOptionAndSecondTexture) {
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"--fullscreen"}), std::invalid_argument);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{"a.png", "b.png"}), std::invalid_argument);
}

TEST_F(ConfigTest, ReadsEnvironment) {
  setenv("FLYCAM_BACKEND", "vulkan", 1);
  setenv("FLYCAM_VERBOSE", "1", 1);
  const Config cfg = ParseConfig(std::vector<std::string>{});
  EXPECT_EQ(cfg.backend, "vulkan");
  EXPECT_TRUE(cfg.verbose);
  EXPECT_TRUE(flycam::Verbose());
}

TEST_F(ConfigTest, RejectsUnknownBackend) {
  setenv("FLYCAM_BACKEND", "glide", 1);
  EXPECT_THROW(ParseConfig(std::vector<std::string>{}), std::invalid_argument);
}

TEST_F(ConfigTest, ArgvSkipsProgramName) {
  char prog[] = "flycam";
  char tex[] = "grass.jpg";
  char* argv[] = {prog, tex, nullptr};
  const Config cfg = ParseConfig(2, argv);
  ASSERT_TRUE(cfg.texture_path.has_value());
  EXPECT_EQ(cfg.texture_path->string(), "grass.jpg");
}
