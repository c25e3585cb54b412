// NOLINTBEGIN(misc-include-cleaner)
#include <catch2/catch.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <kb_bridge/config.hpp>
#include <kb_bridge/error.hpp>
#include <sstream>
#include <string>
// NOLINTEND(misc-include-cleaner)

namespace {
Json::Value parse(const std::string& text)
{
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::istringstream input(text);
  REQUIRE(Json::parseFromStream(builder, input, &root, &errors));
  return root;
}

// Returns the key named by the ConfigError thrown for text, or "" if none was thrown
std::string rejected_key(const std::string& text)
{
  try {
    (void)kb_bridge::load_config(parse(text));
  } catch (const kb_bridge::ConfigError& error) {
    return error.key();
  }
  return {};
}
} // namespace

TEST_CASE("ServiceConfig defaults", "[config]")
{
  const kb_bridge::ServiceConfig config;
  REQUIRE(config.timeouts.search == std::chrono::seconds(15));
  REQUIRE(config.timeouts.find == std::chrono::seconds(30));
  REQUIRE(config.timeouts.add_resource == std::chrono::seconds(120));
  REQUIRE(config.timeouts.list_directory == std::chrono::seconds(15));
  REQUIRE(config.timeouts.read == std::chrono::seconds(15));
  REQUIRE(config.timeouts.abstract == std::chrono::seconds(15));
  REQUIRE(config.timeouts.list_sessions == std::chrono::seconds(15));
  REQUIRE(config.timeouts.retrieve_context == std::chrono::seconds(10));
  REQUIRE(config.idle_poll == std::chrono::seconds(1));
  REQUIRE(config.read_limit == 2000U);
  REQUIRE(config.snippet_limit == 300U);
  REQUIRE(config.context_snippet_limit == 500U);
  REQUIRE(config.session_list_limit == 20U);
  REQUIRE(config.data_dir.filename() == "data");
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("load_config overrides only the keys present", "[config]")
{
  const auto config = kb_bridge::load_config(parse(R"({
    "data_dir": "/var/lib/kb",
    "timeouts_ms": { "search": 2500, "add_resource": 60000 },
    "idle_poll_ms": 250,
    "read_limit": 100,
    "unknown_key": true
  })"));

  REQUIRE(config.data_dir == std::filesystem::path("/var/lib/kb"));
  REQUIRE(config.timeouts.search == std::chrono::milliseconds(2500));
  REQUIRE(config.timeouts.add_resource == std::chrono::seconds(60));
  REQUIRE(config.timeouts.find == std::chrono::seconds(30));
  REQUIRE(config.idle_poll == std::chrono::milliseconds(250));
  REQUIRE(config.read_limit == 100U);
  REQUIRE(config.snippet_limit == 300U);
}

TEST_CASE("load_config rejects bad values by key", "[config]")
{
  REQUIRE(rejected_key("[]") == "<root>");
  REQUIRE(rejected_key(R"({"data_dir": 5})") == "data_dir");
  REQUIRE(rejected_key(R"({"timeouts_ms": 5})") == "timeouts_ms");
  REQUIRE(rejected_key(R"({"timeouts_ms": {"read": "fast"}})") == "read");
  REQUIRE(rejected_key(R"({"timeouts_ms": {"find": 1.5}})") == "find");
  REQUIRE(rejected_key(R"({"read_limit": -1})") == "read_limit");
  REQUIRE(rejected_key(R"({"snippet_limit": 0})") == "snippet_limit");
  REQUIRE(rejected_key(R"({"idle_poll_ms": 0})") == "idle_poll_ms");
  REQUIRE(rejected_key(R"({"add_wait_ms": -5})") == "add_wait_ms");
  REQUIRE(rejected_key(R"({"read_limit": 10})").empty());
}

TEST_CASE("load_config rejects integers past the signed 64-bit range", "[config]")
{
  REQUIRE(rejected_key(R"({"idle_poll_ms": 18446744073709551615})") == "idle_poll_ms");
  REQUIRE(rejected_key(R"({"timeouts_ms": {"search": 18446744073709551615}})") == "search");
  REQUIRE(rejected_key(R"({"session_list_limit": -9223372036854775808})") == "session_list_limit");
}

TEST_CASE("Durations are capped at one day", "[config]")
{
  REQUIRE(rejected_key(R"({"timeouts_ms": {"search": 9000000000000000000}})") == "timeouts_ms.search");
  REQUIRE(rejected_key(R"({"idle_poll_ms": 86400001})") == "idle_poll_ms");
  REQUIRE(rejected_key(R"({"add_wait_ms": 86400001})") == "add_wait_ms");
  REQUIRE(rejected_key(R"({"timeouts_ms": {"add_resource": 86400000}})").empty());

  kb_bridge::ServiceConfig config;
  config.timeouts.find = kb_bridge::max_duration + std::chrono::milliseconds(1);
  REQUIRE_THROWS_AS(config.validate(), kb_bridge::ConfigError);
}

TEST_CASE("Timeouts must exceed the idle poll period", "[config]")
{
  REQUIRE(rejected_key(R"({"idle_poll_ms": 20000})") == "timeouts_ms.search");
  REQUIRE(rejected_key(R"({"timeouts_ms": {"retrieve_context": 1000}})") == "timeouts_ms.retrieve_context");

  kb_bridge::ServiceConfig config;
  config.timeouts.list_sessions = std::chrono::milliseconds(500);
  try {
    config.validate();
    FAIL("validate accepted a timeout below idle_poll");
  } catch (const kb_bridge::ConfigError& error) {
    REQUIRE(error.key() == "timeouts_ms.list_sessions");
    REQUIRE(std::string(error.what()) == "invalid config 'timeouts_ms.list_sessions': must exceed idle_poll_ms");
  }
}

TEST_CASE("load_config_file", "[config]")
{
  const auto path = std::filesystem::temp_directory_path() / "kb_bridge_test_config.json";

  SECTION("reads a file")
  {
    std::ofstream(path) << R"({"snippet_limit": 42})";
    const auto config = kb_bridge::load_config_file(path);
    REQUIRE(config.snippet_limit == 42U);
  }

  SECTION("malformed JSON names the file")
  {
    std::ofstream(path) << "{ nope";
    try {
      (void)kb_bridge::load_config_file(path);
      FAIL("malformed file accepted");
    } catch (const kb_bridge::ConfigError& error) {
      REQUIRE(error.key() == path.string());
    }
  }

  SECTION("missing file")
  {
    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(kb_bridge::load_config_file(path), kb_bridge::ConfigError);
  }

  std::filesystem::remove(path);
}

TEST_CASE("default_config_path honours KB_BRIDGE_CONFIG_FILE", "[config]")
{
  // NOLINTBEGIN(concurrency-mt-unsafe)
  ::setenv("KB_BRIDGE_CONFIG_FILE", "/etc/kb_bridge.json", 1);
  REQUIRE(kb_bridge::default_config_path() == std::filesystem::path("/etc/kb_bridge.json"));

  ::unsetenv("KB_BRIDGE_CONFIG_FILE");
  const auto fallback = kb_bridge::default_config_path();
  REQUIRE(fallback.filename() == "config.json");
  REQUIRE(fallback.parent_path().filename() == ".kb_bridge");
  // NOLINTEND(concurrency-mt-unsafe)
}
