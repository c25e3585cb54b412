// NOLINTBEGIN(misc-include-cleaner)
#include <catch2/catch.hpp>
#include <chrono>
#include <kb_bridge/config.hpp>
#include <kb_bridge/router.hpp>
#include <kb_bridge/service.hpp>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "test_utils.hpp"
// NOLINTEND(misc-include-cleaner)

namespace {
constexpr auto kWait = std::chrono::seconds(5);

kb_bridge::ServiceConfig router_config()
{
  kb_bridge::ServiceConfig config;
  config.idle_poll = std::chrono::milliseconds(20);
  return config;
}

kb_bridge::Request http_get(std::string path, std::map<std::string, std::string> query = {})
{
  return { .method = "GET", .path = std::move(path), .query = std::move(query), .body = {} };
}

kb_bridge::Request http_post(std::string path, std::string body)
{
  return { .method = "POST", .path = std::move(path), .query = {}, .body = std::move(body) };
}

struct Fixture
{
  std::shared_ptr<MockState> state = std::make_shared<MockState>();
  kb_bridge::KnowledgeService service{ mock_factory(state), router_config() };
  kb_bridge::Router router{ service };

  void start()
  {
    service.start();
    REQUIRE(service.wait_until_ready(kWait));
  }
};
} // namespace

TEST_CASE("Router reports status", "[router]")
{
  Fixture fixture;

  SECTION("disabled before start")
  {
    const auto response = fixture.router.handle(http_get("/api/kb/status"));
    REQUIRE(response.status == 200);
    REQUIRE(response.body["status"].asString() == "disabled");
    REQUIRE(response.body["message"].asString() == "Knowledge base not initialized");
  }

  SECTION("ok once ready")
  {
    fixture.start();
    const auto response = fixture.router.handle(http_get("/api/kb/status"));
    REQUIRE(response.status == 200);
    REQUIRE(response.body["status"].asString() == "ok");
    REQUIRE(response.body["ready"].asBool());
    REQUIRE(response.text() == R"({"ready":true,"status":"ok"})");
  }
}

TEST_CASE("Router refuses work while the backend is not ready", "[router]")
{
  Fixture fixture;

  for (const auto& request : std::vector<kb_bridge::Request>{ http_post("/api/kb/search", R"({"query":"q"})"),
         http_post("/api/kb/find", R"({"query":"q"})"),
         http_post("/api/kb/add", R"({"path":"/tmp/x"})"),
         http_get("/api/kb/ls"),
         http_get("/api/kb/read", { { "uri", "kb://a" } }),
         http_get("/api/kb/abstract", { { "uri", "kb://a" } }),
         http_get("/api/kb/sessions") }) {
    const auto response = fixture.router.handle(request);
    REQUIRE(response.status == 503);
    REQUIRE(response.body["detail"].asString() == "Knowledge base not initialized");
  }
  REQUIRE(fixture.state->initialize_calls == 0);
}

TEST_CASE("Router rejects unknown paths and methods", "[router]")
{
  Fixture fixture;
  fixture.start();

  REQUIRE(fixture.router.handle(http_get("/api/kb/nope")).status == 404);
  REQUIRE(fixture.router.handle(http_get("/status")).status == 404);
  REQUIRE(fixture.router.handle(http_get("/api/kb/search")).status == 405);
  REQUIRE(fixture.router.handle(http_post("/api/kb/status", "{}")).status == 405);
  REQUIRE(fixture.state->started_calls().empty());
}

TEST_CASE("Router validates request bodies", "[router]")
{
  Fixture fixture;
  fixture.start();

  const auto check = [&](const kb_bridge::Request& request, const std::string& detail) {
    const auto response = fixture.router.handle(request);
    REQUIRE(response.status == 422);
    REQUIRE(response.body["detail"].asString().starts_with(detail));
  };

  check(http_post("/api/kb/search", "{not json"), "malformed JSON body");
  check(http_post("/api/kb/search", "[1, 2]"), "request body must be a JSON object");
  check(http_post("/api/kb/search", "{}"), "missing field 'query'");
  check(http_post("/api/kb/find", R"({"query": 3})"), "field 'query' must be a string");
  check(http_post("/api/kb/search", R"({"query": "q", "limit": 0})"), "field 'limit' must be a positive integer");
  check(http_post("/api/kb/search", R"({"query": "q", "limit": "5"})"), "field 'limit' must be a positive integer");
  check(http_post("/api/kb/search", R"({"query": "q", "limit": 18446744073709551615})"),
    "field 'limit' must be a positive integer");
  check(http_post("/api/kb/find", R"({"query": "q", "limit": 2.5})"), "field 'limit' must be a positive integer");
  check(http_post("/api/kb/add", R"({"file": "x"})"), "missing field 'path'");
  check(http_get("/api/kb/read"), "missing query parameter 'uri'");
  check(http_get("/api/kb/abstract", { { "uri", "" } }), "missing query parameter 'uri'");

  REQUIRE(fixture.state->started_calls().empty());
}

TEST_CASE("Router forwards to the service", "[router]")
{
  Fixture fixture;
  fixture.state->entries = { { .name = "notes.md", .is_dir = false, .size = 5 } };
  fixture.state->documents = { { "kb://doc", "document body" } };
  fixture.state->sessions = { { "alpha" } };
  fixture.start();

  SECTION("search")
  {
    const auto response = fixture.router.handle(http_post("/api/kb/search", R"({"query": "tea", "limit": 2})"));
    REQUIRE(response.status == 200);
    REQUIRE(response.body["result"].asString() == "Search 'tea' found 1 results:\n\n[memory] memory about tea");
  }

  SECTION("find")
  {
    const auto response = fixture.router.handle(http_post("/api/kb/find", R"({"query": "tea"})"));
    REQUIRE(response.body["result"].asString() == "Find 'tea' found 1 results:\n\n[memory] memory about tea");
    REQUIRE(fixture.state->started_calls() == std::vector<std::string>{ "find:tea" });
  }

  SECTION("add")
  {
    const auto response = fixture.router.handle(http_post("/api/kb/add", R"({"path": "/nonexistent/kb_bridge.md"})"));
    REQUIRE(response.body["result"].asString() == "File not found: /nonexistent/kb_bridge.md");
  }

  SECTION("ls uses the default uri")
  {
    const auto response = fixture.router.handle(http_get("/api/kb/ls"));
    REQUIRE(response.body["result"].asString() == "Directory kb://resources/:\n  [F] notes.md (5b)");
  }

  SECTION("ls with an explicit uri")
  {
    const auto response = fixture.router.handle(http_get("/api/kb/ls", { { "uri", "kb://other/" } }));
    REQUIRE(response.body["result"].asString() == "Directory kb://other/:\n  [F] notes.md (5b)");
    REQUIRE(fixture.state->started_calls() == std::vector<std::string>{ "list_directory:kb://other/" });
  }

  SECTION("read and abstract")
  {
    REQUIRE(fixture.router.handle(http_get("/api/kb/read", { { "uri", "kb://doc" } })).body["result"].asString()
            == "document body");
    REQUIRE(fixture.router.handle(http_get("/api/kb/abstract", { { "uri", "kb://doc" } })).body["result"].asString()
            == "abstract of kb://doc");
  }

  SECTION("backend failures are still 200 with degraded text")
  {
    const auto response = fixture.router.handle(http_get("/api/kb/read", { { "uri", "kb://missing" } }));
    REQUIRE(response.status == 200);
    REQUIRE(response.body["result"].asString() == "Read failed: no such resource: kb://missing");
  }

  SECTION("sessions")
  {
    REQUIRE(fixture.router.handle(http_get("/api/kb/sessions")).body["result"].asString() == "Sessions:\n  - alpha");
  }
}
