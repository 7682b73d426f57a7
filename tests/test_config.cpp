#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>

using namespace orchestrator;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { Clear(); }
  void TearDown() override { Clear(); }

  static void Clear() {
    for (const char* name : {"MCP_ORCHESTRATOR_LISTEN_HOST", "MCP_ORCHESTRATOR_LISTEN_PORT",
                             "MCP_ORCHESTRATOR_REGISTRY_PATH", "MCP_ORCHESTRATOR_CONFIG_DIR",
                             "MCP_ORCHESTRATOR_TIMEOUT_SECONDS", "MCP_ORCHESTRATOR_AUTO_APPROVE",
                             "MCP_ORCHESTRATOR_HEALTH_INTERVAL_SECONDS"}) {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.host, "0.0.0.0");
  EXPECT_EQ(cfg.listen.port, 8090);
  EXPECT_EQ(cfg.timeout, std::chrono::seconds(30));
  EXPECT_EQ(cfg.health_interval, std::chrono::seconds(30));
  EXPECT_FALSE(cfg.auto_approve);
  EXPECT_TRUE(cfg.config_dir.empty());
  EXPECT_NE(cfg.registry_path.find("registry.json"), std::string::npos);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("MCP_ORCHESTRATOR_LISTEN_HOST", "127.0.0.1", 1);
  setenv("MCP_ORCHESTRATOR_LISTEN_PORT", "9100", 1);
  setenv("MCP_ORCHESTRATOR_REGISTRY_PATH", "/tmp/reg.json", 1);
  setenv("MCP_ORCHESTRATOR_CONFIG_DIR", "/etc/mcp", 1);
  setenv("MCP_ORCHESTRATOR_TIMEOUT_SECONDS", "12", 1);
  setenv("MCP_ORCHESTRATOR_AUTO_APPROVE", "Yes", 1);
  setenv("MCP_ORCHESTRATOR_HEALTH_INTERVAL_SECONDS", "5", 1);
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.host, "127.0.0.1");
  EXPECT_EQ(cfg.listen.port, 9100);
  EXPECT_EQ(cfg.registry_path, "/tmp/reg.json");
  EXPECT_EQ(cfg.config_dir, "/etc/mcp");
  EXPECT_EQ(cfg.timeout, std::chrono::seconds(12));
  EXPECT_TRUE(cfg.auto_approve);
  EXPECT_EQ(cfg.health_interval, std::chrono::seconds(5));
}

TEST_F(ConfigTest, InvalidNumbersKeepDefaults) {
  setenv("MCP_ORCHESTRATOR_TIMEOUT_SECONDS", "-3", 1);
  setenv("MCP_ORCHESTRATOR_HEALTH_INTERVAL_SECONDS", "soon", 1);
  setenv("MCP_ORCHESTRATOR_AUTO_APPROVE", "maybe", 1);
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.timeout, std::chrono::seconds(30));
  EXPECT_EQ(cfg.health_interval, std::chrono::seconds(30));
  EXPECT_FALSE(cfg.auto_approve);
}

TEST(HttpEndpointTest, ParsesParts) {
  auto ep = ParseHttpEndpoint("http://10.0.0.2:8081/tools/echo", 80);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "10.0.0.2");
  EXPECT_EQ(ep.port, 8081);
  EXPECT_EQ(ep.base_path, "/tools/echo");
  EXPECT_EQ(SchemeHostPort(ep), "http://10.0.0.2:8081");
}

TEST(HttpEndpointTest, DefaultPorts) {
  EXPECT_EQ(ParseHttpEndpoint("http://example.com", 80).port, 80);
  EXPECT_EQ(ParseHttpEndpoint("https://example.com/x", 80).port, 443);
  EXPECT_TRUE(ParseHttpEndpoint("http://example.com", 80).base_path.empty());
}

TEST(TryParseBoolTest, Words) {
  bool b = false;
  EXPECT_TRUE(TryParseBool("on", &b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(TryParseBool("FALSE", &b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(TryParseBool("perhaps", &b));
}
