#include <chrono>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <kb_bridge/config.hpp>
#include <kb_bridge/error.hpp>
#include <kb_bridge/log.hpp>
#include <kb_bridge/router.hpp>
#include <kb_bridge/service.hpp>
#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

#include "in_memory_knowledge_base.hpp"

// =============================================================================
// kb_bridge demo
// One command per run, sent through the Router exactly as an HTTP front end
// would. The backend is a small in-memory engine with some seeded notes.
// =============================================================================

namespace {
constexpr auto kStartupTimeout = std::chrono::seconds(10);
constexpr int kUsageError = 2;

constexpr std::string_view kUsage = R"(usage: kb_bridge_example [--config FILE] [--verbose] COMMAND [ARGS]

commands:
  status                 show whether the knowledge base is ready
  search QUERY [LIMIT]   quick semantic search
  find QUERY [LIMIT]     deeper retrieval, also matches resource names
  add PATH               add a local file as a resource
  ls [URI]               list a directory (default kb://resources/)
  read URI               print a resource, truncated
  abstract URI           print a resource summary
  sessions               list recorded sessions
  context MESSAGE        show MESSAGE augmented with retrieved context
  help                   this text
)";

struct Options
{
  std::optional<std::filesystem::path> config_path;
  bool verbose = false;
  std::vector<std::string> command;
};

std::optional<Options> parse_args(int argc, char** argv)
{
  Options options;
  const std::vector<std::string> args(argv + 1, argv + argc); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (!options.command.empty()) {
      options.command.push_back(args[i]);
    } else if (args[i] == "--config") {
      if (i + 1 == args.size()) { return std::nullopt; }
      options.config_path = args[++i];
    } else if (args[i] == "--verbose") {
      options.verbose = true;
    } else {
      options.command.push_back(args[i]);
    }
  }
  if (options.command.empty()) { return std::nullopt; }
  return options;
}

// Explicit --config must exist; the default location is optional
kb_bridge::ServiceConfig resolve_config(const Options& options)
{
  if (options.config_path) { return kb_bridge::load_config_file(*options.config_path); }
  const auto fallback = kb_bridge::default_config_path();
  if (std::filesystem::exists(fallback)) { return kb_bridge::load_config_file(fallback); }
  return {};
}

std::unique_ptr<kb_bridge::KnowledgeBase> make_demo_backend(const std::filesystem::path& data_dir)
{
  auto kb = std::make_unique<InMemoryKnowledgeBase>(data_dir);
  kb->add_memory("User prefers green tea in the afternoon");
  kb->add_memory("User is migrating the build to CMake presets");
  kb->add_document("tea-guide.md", "Brewing green tea\nUse water at 80C and steep for two minutes.");
  kb->add_document("notes/cmake.md", "CMake presets\nPresets keep configure options in version control.");
  return kb;
}

// Translate a command line into the request an HTTP client would send
std::optional<kb_bridge::Request> to_request(const std::vector<std::string>& command)
{
  const std::string& verb = command.front();
  const auto arg = [&](std::size_t i) -> const std::string* { return i < command.size() ? &command[i] : nullptr; };

  const Json::StreamWriterBuilder writer;
  const auto search_body = [&]() {
    Json::Value body(Json::objectValue);
    body["query"] = *arg(1);
    if (const auto* limit = arg(2)) { body["limit"] = std::stoi(*limit); }
    return Json::writeString(writer, body);
  };

  if (verb == "status") { return kb_bridge::Request{ .method = "GET", .path = "/api/kb/status" }; }
  if (verb == "sessions") { return kb_bridge::Request{ .method = "GET", .path = "/api/kb/sessions" }; }
  if (verb == "ls") {
    kb_bridge::Request request{ .method = "GET", .path = "/api/kb/ls" };
    if (const auto* uri = arg(1)) { request.query["uri"] = *uri; }
    return request;
  }
  if ((verb == "search" || verb == "find") && arg(1) != nullptr) {
    return kb_bridge::Request{ .method = "POST", .path = "/api/kb/" + verb, .body = search_body() };
  }
  if (verb == "add" && arg(1) != nullptr) {
    Json::Value body(Json::objectValue);
    body["path"] = std::filesystem::absolute(*arg(1)).string();
    return kb_bridge::Request{ .method = "POST", .path = "/api/kb/add", .body = Json::writeString(writer, body) };
  }
  if ((verb == "read" || verb == "abstract") && arg(1) != nullptr) {
    return kb_bridge::Request{ .method = "GET", .path = "/api/kb/" + verb, .query = { { "uri", *arg(1) } } };
  }
  return std::nullopt;
}

int run(const Options& options)
{
  const auto config = resolve_config(options);
  kb_bridge::KnowledgeService service(
    [data_dir = config.data_dir] { return make_demo_backend(data_dir); }, config);
  const kb_bridge::Router router(service);

  service.start();
  if (!service.wait_until_ready(kStartupTimeout)) {
    kb_bridge::logger()->error("knowledge base did not become ready");
  }

  int exit_code = 0;
  const std::string& verb = options.command.front();
  if (verb == "context" && options.command.size() > 1) {
    fmt::print("{}\n", kb_bridge::augment_with_context(service, options.command[1]));
  } else if (auto request = to_request(options.command)) {
    const auto response = router.handle(*request);
    if (response.body.isMember("result")) {
      fmt::print("{}\n", response.body["result"].asString());
    } else if (response.status == 200) {
      fmt::print("{}\n", response.text());
    } else {
      fmt::print(stderr, "error {}: {}\n", response.status, response.body["detail"].asString());
      exit_code = 1;
    }
  } else {
    fmt::print(stderr, "{}", kUsage);
    exit_code = kUsageError;
  }

  service.close();
  return exit_code;
}
} // namespace

int main(int argc, char** argv)
{
  const auto options = parse_args(argc, argv);
  if (!options || options->command.front() == "help") {
    fmt::print(options ? stdout : stderr, "{}", kUsage);
    return options ? 0 : kUsageError;
  }
  if (options->verbose) { kb_bridge::logger()->set_level(spdlog::level::debug); }

  try {
    return run(*options);
  } catch (const kb_bridge::ConfigError& error) {
    kb_bridge::logger()->error("{}", error.what());
    return kUsageError;
  } catch (const std::exception& error) {
    kb_bridge::logger()->error("unexpected failure: {}", error.what());
    return 1;
  }
}
