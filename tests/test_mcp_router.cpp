#include <gtest/gtest.h>
#include "mcp_router.hpp"
#include "test_helpers.hpp"

using namespace orchestrator;
using orchestrator_test::LocalHttpServer;
using orchestrator_test::TempDir;

class McpRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ManagerOptions opts;
    opts.registry_path = tmp.File("registry.json");
    manager = std::make_unique<Manager>(opts);
    router = std::make_unique<McpRouter>(manager.get());
    router->Register(&http.Server());
    http.Start();
    client = std::make_unique<httplib::Client>("127.0.0.1", http.Port());
  }

  void TearDown() override { http.Stop(); }

  static nlohmann::json Body(const httplib::Result& res) { return nlohmann::json::parse(res->body, nullptr, false); }

  void AddEchoServer() {
    auto res = client->Post("/api/mcp/servers",
                            R"({"id":"s1","name":"echo","type":"local","metadata":{"start_cmd":"sleep 30"}})",
                            "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 201);
    Error err;
    Tool t;
    t.id = "t1";
    t.parameters = {{"x", "string", "", true, nullptr}};
    ASSERT_TRUE(manager->RegisterLocalTool(
        "s1", t,
        [](const CallContext&, const nlohmann::json& params, Error*) {
          return std::optional<nlohmann::json>(nlohmann::json{{"echo", params["x"]}});
        },
        &err));
  }

  TempDir tmp;
  std::unique_ptr<Manager> manager;
  std::unique_ptr<McpRouter> router;
  LocalHttpServer http;
  std::unique_ptr<httplib::Client> client;
};

TEST_F(McpRouterTest, Health) {
  auto res = client->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(Body(res)["ok"], true);
}

TEST_F(McpRouterTest, ServerLifecycle) {
  AddEchoServer();

  auto list = client->Get("/api/mcp/servers");
  ASSERT_TRUE(list);
  ASSERT_EQ(list->status, 200);
  auto servers = Body(list);
  ASSERT_EQ(servers.size(), 1u);
  EXPECT_EQ(servers[0]["id"], "s1");
  EXPECT_EQ(servers[0]["status"], "stopped");
  EXPECT_EQ(servers[0]["tools"].size(), 1u);

  auto start = client->Post("/api/mcp/servers/start?id=s1", "", "application/json");
  ASSERT_TRUE(start);
  EXPECT_EQ(start->status, 204);
  EXPECT_EQ(Body(client->Get("/api/mcp/servers"))[0]["status"], "running");

  auto stop = client->Post("/api/mcp/servers/stop?id=s1", "", "application/json");
  ASSERT_TRUE(stop);
  EXPECT_EQ(stop->status, 204);

  auto del = client->Delete("/api/mcp/servers?id=s1");
  ASSERT_TRUE(del);
  EXPECT_EQ(del->status, 204);
  EXPECT_TRUE(Body(client->Get("/api/mcp/tools")).empty());
}

TEST_F(McpRouterTest, ErrorMapping) {
  AddEchoServer();

  auto dup = client->Post("/api/mcp/servers", R"({"id":"s1","type":"local"})", "application/json");
  ASSERT_TRUE(dup);
  EXPECT_EQ(dup->status, 409);
  EXPECT_EQ(Body(dup)["error"]["type"], "already_exists");

  auto missing = client->Post("/api/mcp/servers/start?id=nope", "", "application/json");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);

  auto no_id = client->Delete("/api/mcp/servers");
  ASSERT_TRUE(no_id);
  EXPECT_EQ(no_id->status, 400);

  auto bad_json = client->Post("/api/mcp/servers", "{", "application/json");
  ASSERT_TRUE(bad_json);
  EXPECT_EQ(bad_json->status, 400);

  auto bad_type = client->Post("/api/mcp/servers", R"({"id":"x","type":"cloud"})", "application/json");
  ASSERT_TRUE(bad_type);
  EXPECT_EQ(bad_type->status, 400);

  auto unknown_route = client->Get("/api/mcp/nothing");
  ASSERT_TRUE(unknown_route);
  EXPECT_EQ(unknown_route->status, 404);
  EXPECT_TRUE(Body(unknown_route).contains("error"));
}

TEST_F(McpRouterTest, ExecuteRequiresApproval) {
  AddEchoServer();
  ASSERT_TRUE(client->Post("/api/mcp/servers/start?id=s1", "", "application/json"));

  auto denied = client->Post("/api/mcp/tools", R"({"tool_id":"t1","params":{"x":"hi"}})", "application/json");
  ASSERT_TRUE(denied);
  EXPECT_EQ(denied->status, 403);

  auto approved =
      client->Post("/api/mcp/tools", R"({"tool_id":"t1","params":{"x":"hi"},"approved":true})", "application/json");
  ASSERT_TRUE(approved);
  ASSERT_EQ(approved->status, 200);
  auto body = Body(approved);
  EXPECT_EQ(body["tool_id"], "t1");
  EXPECT_EQ(body["status"], "success");
  EXPECT_EQ(body["result"]["echo"], "hi");
}

TEST_F(McpRouterTest, ExecuteErrors) {
  AddEchoServer();
  ASSERT_TRUE(client->Put("/api/mcp/config", R"({"auto_approve":true})", "application/json"));

  auto not_running = client->Post("/api/mcp/tools", R"({"tool_id":"t1","params":{"x":"hi"}})", "application/json");
  ASSERT_TRUE(not_running);
  EXPECT_EQ(not_running->status, 409);
  EXPECT_EQ(Body(not_running)["error"]["message"], "server is not running");

  ASSERT_TRUE(client->Post("/api/mcp/servers/start?id=s1", "", "application/json"));
  auto invalid = client->Post("/api/mcp/tools", R"({"tool_id":"t1","params":{}})", "application/json");
  ASSERT_TRUE(invalid);
  EXPECT_EQ(invalid->status, 400);
  EXPECT_EQ(Body(invalid)["error"]["type"], "validation_failed");

  auto unknown = client->Post("/api/mcp/tools", R"({"tool_id":"zzz"})", "application/json");
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->status, 404);

  auto no_tool = client->Post("/api/mcp/tools", R"({"params":{}})", "application/json");
  ASSERT_TRUE(no_tool);
  EXPECT_EQ(no_tool->status, 400);
}

TEST_F(McpRouterTest, ConfigRoundTrip) {
  auto get = client->Get("/api/mcp/config");
  ASSERT_TRUE(get);
  EXPECT_EQ(Body(get)["auto_approve"], false);
  EXPECT_EQ(Body(get)["timeout"].get<int64_t>(), 30000000000LL);

  auto put = client->Put("/api/mcp/config", R"({"auto_approve":true,"timeout":5000000000})", "application/json");
  ASSERT_TRUE(put);
  EXPECT_EQ(put->status, 204);

  auto after = Body(client->Get("/api/mcp/config"));
  EXPECT_EQ(after["auto_approve"], true);
  EXPECT_EQ(after["timeout"].get<int64_t>(), 5000000000LL);

  auto bad = client->Put("/api/mcp/config", R"({"timeout":-1})", "application/json");
  ASSERT_TRUE(bad);
  EXPECT_EQ(bad->status, 400);

  auto sub_ms = client->Put("/api/mcp/config", R"({"timeout":500000})", "application/json");
  ASSERT_TRUE(sub_ms);
  EXPECT_EQ(sub_ms->status, 400);
  EXPECT_EQ(Body(client->Get("/api/mcp/config"))["timeout"].get<int64_t>(), 5000000000LL);

  auto wrong_type = client->Put("/api/mcp/config", R"({"auto_approve":"yes"})", "application/json");
  ASSERT_TRUE(wrong_type);
  EXPECT_EQ(wrong_type->status, 400);
}

TEST(HttpStatusTest, CodeMapping) {
  EXPECT_EQ(HttpStatusFor(ErrorCode::kNotFound), 404);
  EXPECT_EQ(HttpStatusFor(ErrorCode::kAlreadyExists), 409);
  EXPECT_EQ(HttpStatusFor(ErrorCode::kValidationFailed), 400);
  EXPECT_EQ(HttpStatusFor(ErrorCode::kTimeout), 504);
  EXPECT_EQ(HttpStatusFor(ErrorCode::kNotImplemented), 501);
  EXPECT_EQ(HttpStatusFor(ErrorCode::kPersistenceFailure), 500);
}
