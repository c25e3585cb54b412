#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <string>

#include "error.hpp"

namespace kb_bridge {

// Per-operation facade budgets. Writes get much longer than reads.
struct Timeouts
{
  std::chrono::milliseconds search{ 15000 };
  std::chrono::milliseconds find{ 30000 };
  std::chrono::milliseconds add_resource{ 120000 };
  std::chrono::milliseconds list_directory{ 15000 };
  std::chrono::milliseconds read{ 15000 };
  std::chrono::milliseconds abstract{ 15000 };
  std::chrono::milliseconds list_sessions{ 15000 };
  std::chrono::milliseconds retrieve_context{ 10000 };
};

namespace detail {

inline std::filesystem::path home_dir()
{
  // NOLINTNEXTLINE(concurrency-mt-unsafe) - read once at configuration time
  if (const char* home = std::getenv("HOME")) { return home; }
  return std::filesystem::current_path();
}

} // namespace detail

// Upper bound for every configured duration; larger values overflow steady_clock waits
inline constexpr std::chrono::milliseconds max_duration = std::chrono::hours(24);

struct ServiceConfig
{
  std::filesystem::path data_dir = detail::home_dir() / ".kb_bridge" / "data";
  Timeouts timeouts;
  std::chrono::milliseconds add_wait{ 120000 }; // Backend-side indexing wait for add_resource
  std::chrono::milliseconds idle_poll{ 1000 }; // Worker wake-up period when the queue is empty
  std::size_t read_limit = 2000;
  std::size_t snippet_limit = 300;
  std::size_t context_snippet_limit = 500;
  std::size_t session_list_limit = 20;

  // Throws ConfigError naming the first offending key
  void validate() const
  {
    check_duration("idle_poll_ms", idle_poll);
    check_duration("add_wait_ms", add_wait);
    check_timeout("timeouts_ms.search", timeouts.search);
    check_timeout("timeouts_ms.find", timeouts.find);
    check_timeout("timeouts_ms.add_resource", timeouts.add_resource);
    check_timeout("timeouts_ms.list_directory", timeouts.list_directory);
    check_timeout("timeouts_ms.read", timeouts.read);
    check_timeout("timeouts_ms.abstract", timeouts.abstract);
    check_timeout("timeouts_ms.list_sessions", timeouts.list_sessions);
    check_timeout("timeouts_ms.retrieve_context", timeouts.retrieve_context);
    if (read_limit == 0) { throw ConfigError("read_limit", "must be positive"); }
    if (snippet_limit == 0) { throw ConfigError("snippet_limit", "must be positive"); }
    if (context_snippet_limit == 0) { throw ConfigError("context_snippet_limit", "must be positive"); }
    if (session_list_limit == 0) { throw ConfigError("session_list_limit", "must be positive"); }
  }

private:
  static void check_duration(const char* key, std::chrono::milliseconds value)
  {
    if (value.count() <= 0) { throw ConfigError(key, "must be positive"); }
    if (value > max_duration) { throw ConfigError(key, "must not exceed 24 hours"); }
  }

  void check_timeout(const char* key, std::chrono::milliseconds value) const
  {
    if (value <= idle_poll) { throw ConfigError(key, "must exceed idle_poll_ms"); }
    if (value > max_duration) { throw ConfigError(key, "must not exceed 24 hours"); }
  }
};

namespace detail {

inline std::chrono::milliseconds read_millis(const Json::Value& node, const char* key, std::chrono::milliseconds fallback)
{
  if (!node.isMember(key)) { return fallback; }
  const Json::Value& value = node[key];
  if (!value.isIntegral() || !value.isInt64()) { throw ConfigError(key, "expected an integer number of milliseconds"); }
  return std::chrono::milliseconds(value.asInt64());
}

inline std::size_t read_count(const Json::Value& node, const char* key, std::size_t fallback)
{
  if (!node.isMember(key)) { return fallback; }
  const Json::Value& value = node[key];
  if (!value.isIntegral() || !value.isUInt64()) { throw ConfigError(key, "expected a non-negative integer"); }
  return static_cast<std::size_t>(value.asUInt64());
}

} // namespace detail

// Missing keys keep their defaults, unknown keys are ignored
inline ServiceConfig load_config(const Json::Value& root)
{
  if (!root.isObject()) { throw ConfigError("<root>", "expected a JSON object"); }

  ServiceConfig config;
  if (root.isMember("data_dir")) {
    if (!root["data_dir"].isString()) { throw ConfigError("data_dir", "expected a string"); }
    config.data_dir = root["data_dir"].asString();
  }

  if (root.isMember("timeouts_ms")) {
    const Json::Value& node = root["timeouts_ms"];
    if (!node.isObject()) { throw ConfigError("timeouts_ms", "expected an object"); }
    auto& timeouts = config.timeouts;
    timeouts.search = detail::read_millis(node, "search", timeouts.search);
    timeouts.find = detail::read_millis(node, "find", timeouts.find);
    timeouts.add_resource = detail::read_millis(node, "add_resource", timeouts.add_resource);
    timeouts.list_directory = detail::read_millis(node, "list_directory", timeouts.list_directory);
    timeouts.read = detail::read_millis(node, "read", timeouts.read);
    timeouts.abstract = detail::read_millis(node, "abstract", timeouts.abstract);
    timeouts.list_sessions = detail::read_millis(node, "list_sessions", timeouts.list_sessions);
    timeouts.retrieve_context = detail::read_millis(node, "retrieve_context", timeouts.retrieve_context);
  }

  config.add_wait = detail::read_millis(root, "add_wait_ms", config.add_wait);
  config.idle_poll = detail::read_millis(root, "idle_poll_ms", config.idle_poll);
  config.read_limit = detail::read_count(root, "read_limit", config.read_limit);
  config.snippet_limit = detail::read_count(root, "snippet_limit", config.snippet_limit);
  config.context_snippet_limit = detail::read_count(root, "context_snippet_limit", config.context_snippet_limit);
  config.session_list_limit = detail::read_count(root, "session_list_limit", config.session_list_limit);

  config.validate();
  return config;
}

inline ServiceConfig load_config_file(const std::filesystem::path& path)
{
  std::ifstream input(path);
  if (!input) { throw ConfigError(path.string(), "cannot open file"); }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, input, &root, &errors)) { throw ConfigError(path.string(), errors); }
  return load_config(root);
}

// $KB_BRIDGE_CONFIG_FILE when set, else ~/.kb_bridge/config.json
inline std::filesystem::path default_config_path()
{
  // NOLINTNEXTLINE(concurrency-mt-unsafe) - read once at configuration time
  if (const char* explicit_path = std::getenv("KB_BRIDGE_CONFIG_FILE")) { return explicit_path; }
  return detail::home_dir() / ".kb_bridge" / "config.json";
}

} // namespace kb_bridge
