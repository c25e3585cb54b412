#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bridge.hpp"
#include "config.hpp"
#include "error.hpp"
#include "knowledge_base.hpp"
#include "log.hpp"
#include "pending_call.hpp"
#include "text.hpp"

namespace kb_bridge {

inline constexpr std::string_view default_directory_uri = "kb://resources/";
inline constexpr std::string_view not_initialized_message = "Knowledge base not initialized";

inline constexpr std::size_t default_search_limit = 5;
inline constexpr std::size_t default_find_limit = 10;
inline constexpr std::size_t default_context_limit = 3;

// =============================================================================
// PendingText - an in-flight service operation
// The operation's timeout budget starts at submission. get() waits out what is
// left of it, then renders the outcome the same way the blocking call does.
// =============================================================================

template<typename R> class PendingText
{
public:
  using formatter = std::function<std::string(Outcome<R>)>;

  PendingText(Ticket<R> ticket, std::chrono::milliseconds budget, formatter format)
    : ticket_(std::move(ticket)), budget_(budget), deadline_(std::chrono::steady_clock::now() + budget),
      format_(std::move(format))
  {}

  [[nodiscard]] const std::string& operation() const noexcept { return ticket_.operation(); }

  // True once the worker finished the call, or the call was refused
  [[nodiscard]] bool is_done() const { return ticket_.is_done(); }

  [[nodiscard]] std::string get() const
  {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
    auto outcome = ticket_.wait_for(std::max(left, std::chrono::milliseconds(0)));
    if (!outcome) { detail::log_unfinished(outcome.error(), budget_); }
    return format_(std::move(outcome));
  }

private:
  Ticket<R> ticket_;
  std::chrono::milliseconds budget_;
  std::chrono::steady_clock::time_point deadline_;
  formatter format_;
};

// =============================================================================
// KnowledgeService - text-producing facade over Bridge<KnowledgeBase>
// Every operation returns something printable; timeouts, refusals and backend
// failures come back as degraded text, never as exceptions. The *_async forms
// return at once; the plain forms block for at most the operation's timeout.
// A PendingText does not refer back to the service and may outlive it.
// =============================================================================

class KnowledgeService
{
public:
  using backend_factory = Bridge<KnowledgeBase>::backend_factory;

  // Throws ConfigError if config does not validate
  explicit KnowledgeService(backend_factory factory, ServiceConfig config = {})
    : config_(validated(std::move(config))), bridge_(std::move(factory), config_.idle_poll)
  {}

  void start()
  {
    logger()->info("starting knowledge base worker, data_dir={}", config_.data_dir.string());
    bridge_.start();
  }

  template<typename Rep, typename Period> bool wait_until_ready(std::chrono::duration<Rep, Period> timeout)
  {
    return bridge_.wait_until_ready(timeout);
  }

  [[nodiscard]] bool ready() const noexcept { return bridge_.ready(); }

  void close() { bridge_.close(); }

  [[nodiscard]] const ServiceConfig& config() const noexcept { return config_; }
  [[nodiscard]] const Bridge<KnowledgeBase>& bridge() const noexcept { return bridge_; }

  std::string search(const std::string& query, std::size_t limit = default_search_limit)
  {
    return search_async(query, limit).get();
  }

  PendingText<SearchResult> search_async(const std::string& query, std::size_t limit = default_search_limit)
  {
    auto ticket = bridge_.submit("search", [query, limit](KnowledgeBase& kb) { return kb.search(query, limit); });
    return { std::move(ticket),
      config_.timeouts.search,
      [subject = fmt::format("Search '{}'", query), snippet = config_.snippet_limit](Outcome<SearchResult> outcome) {
        if (!outcome) { return degraded(outcome.error(), subject); }
        auto lines = hit_lines(*outcome, snippet);
        if (lines.empty()) { return fmt::format("{} returned no results (total={})", subject, outcome->total); }
        return fmt::format("{} found {} results:\n\n{}", subject, outcome->total, join(lines, "\n\n"));
      } };
  }

  std::string find(const std::string& query, std::size_t limit = default_find_limit)
  {
    return find_async(query, limit).get();
  }

  PendingText<SearchResult> find_async(const std::string& query, std::size_t limit = default_find_limit)
  {
    auto ticket = bridge_.submit("find", [query, limit](KnowledgeBase& kb) { return kb.find(query, limit); });
    return { std::move(ticket),
      config_.timeouts.find,
      [subject = fmt::format("Find '{}'", query), snippet = config_.snippet_limit](Outcome<SearchResult> outcome) {
        if (!outcome) { return degraded(outcome.error(), subject); }
        auto lines = hit_lines(*outcome, snippet);
        if (outcome->total == 0 || lines.empty()) { return subject + " returned no results"; }
        return fmt::format("{} found {} results:\n\n{}", subject, outcome->total, join(lines, "\n\n"));
      } };
  }

  std::string add_resource(const std::string& path) { return add_resource_async(path).get(); }

  PendingText<std::optional<AddResourceResult>> add_resource_async(const std::string& path)
  {
    const auto wait = config_.add_wait;
    // The existence check runs on the worker too, next to the backend call that depends on it
    auto ticket = bridge_.submit("add_resource", [path, wait](KnowledgeBase& kb) {
      std::optional<AddResourceResult> added;
      if (std::filesystem::exists(path)) { added = kb.add_resource(path, true, wait); }
      return added;
    });
    return { std::move(ticket), config_.timeouts.add_resource, [path](Outcome<std::optional<AddResourceResult>> outcome) {
              if (!outcome) { return degraded(outcome.error(), "Adding resource"); }
              const auto& added = *outcome;
              if (!added) { return "File not found: " + path; }
              if (!added->errors.empty()) { return "Failed to add resource: " + join(added->errors, ", "); }
              return fmt::format("Resource added: {} (status={})", added->root_uri, added->status);
            } };
  }

  std::string list_directory(const std::string& uri = std::string(default_directory_uri))
  {
    return list_directory_async(uri).get();
  }

  PendingText<std::vector<DirectoryEntry>> list_directory_async(
    const std::string& uri = std::string(default_directory_uri))
  {
    auto ticket = bridge_.submit("list_directory", [uri](KnowledgeBase& kb) { return kb.list_directory(uri); });
    return { std::move(ticket), config_.timeouts.list_directory, [uri](Outcome<std::vector<DirectoryEntry>> outcome) {
              if (!outcome) { return degraded(outcome.error(), "Listing directory " + uri); }
              if (outcome->empty()) { return fmt::format("Directory {} is empty", uri); }

              std::vector<std::string> lines;
              lines.reserve(outcome->size());
              for (const auto& entry : *outcome) {
                lines.push_back(fmt::format("  [{}] {} ({}b)", entry.is_dir ? 'D' : 'F', entry.name, entry.size));
              }
              return fmt::format("Directory {}:\n{}", uri, join(lines, "\n"));
            } };
  }

  std::string read(const std::string& uri) { return read_async(uri).get(); }

  PendingText<std::string> read_async(const std::string& uri)
  {
    auto ticket = bridge_.submit("read", [uri](KnowledgeBase& kb) { return kb.read(uri); });
    return { std::move(ticket), config_.timeouts.read, [limit = config_.read_limit](Outcome<std::string> outcome) {
              if (!outcome) { return degraded(outcome.error(), "Read"); }
              return truncate_utf8(*outcome, limit);
            } };
  }

  std::string abstract(const std::string& uri) { return abstract_async(uri).get(); }

  PendingText<std::string> abstract_async(const std::string& uri)
  {
    auto ticket = bridge_.submit("abstract", [uri](KnowledgeBase& kb) { return kb.abstract(uri); });
    return { std::move(ticket), config_.timeouts.abstract, [](Outcome<std::string> outcome) {
              if (!outcome) { return degraded(outcome.error(), "Abstract"); }
              return std::move(*outcome);
            } };
  }

  std::string list_sessions() { return list_sessions_async().get(); }

  PendingText<std::vector<SessionInfo>> list_sessions_async()
  {
    auto ticket = bridge_.submit("list_sessions", [](KnowledgeBase& kb) { return kb.list_sessions(); });
    return { std::move(ticket),
      config_.timeouts.list_sessions,
      [limit = config_.session_list_limit](Outcome<std::vector<SessionInfo>> outcome) {
        if (!outcome) { return degraded(outcome.error(), "Listing sessions"); }
        if (outcome->empty()) { return std::string("No sessions recorded"); }

        std::vector<std::string> lines;
        for (const auto& session : *outcome) {
          if (lines.size() == limit) { break; }
          lines.push_back("  - " + session.session_id);
        }
        return "Sessions:\n" + join(lines, "\n");
      } };
  }

  // Context block for prompt augmentation; empty when unavailable or nothing matched
  std::string retrieve_context(const std::string& query, std::size_t limit = default_context_limit)
  {
    return retrieve_context_async(query, limit).get();
  }

  PendingText<SearchResult> retrieve_context_async(const std::string& query, std::size_t limit = default_context_limit)
  {
    auto ticket =
      bridge_.submit("retrieve_context", [query, limit](KnowledgeBase& kb) { return kb.search(query, limit); });
    return { std::move(ticket),
      config_.timeouts.retrieve_context,
      [snippet = config_.context_snippet_limit](Outcome<SearchResult> outcome) {
        if (!outcome) { return std::string(); }

        std::vector<std::string> parts;
        std::size_t taken = 0;
        for (const auto& memory : outcome->memories) {
          if (taken++ == max_context_items) { break; }
          if (!memory.content.empty()) { parts.push_back("[memory] " + memory.content); }
        }
        taken = 0;
        for (const auto& resource : outcome->resources) {
          if (taken++ == max_context_items) { break; }
          if (!resource.text().empty()) {
            parts.push_back(
              fmt::format("[kb:{}] {}", resource.display_title(), truncate_utf8(resource.text(), snippet)));
          }
        }
        return join(parts, "\n\n");
      } };
  }

private:
  static constexpr std::size_t max_context_items = 3;

  static ServiceConfig validated(ServiceConfig config)
  {
    config.validate();
    return config;
  }

  static std::string degraded(const CallError& error, const std::string& subject)
  {
    switch (error.kind) {
    case ErrorKind::NotReady:
      return std::string(not_initialized_message);
    case ErrorKind::Timeout:
      return subject + " timed out";
    case ErrorKind::BackendFailure:
    case ErrorKind::BackendUnavailable:
      break;
    }
    return fmt::format("{} failed: {}", subject, error.message);
  }

  static std::vector<std::string> hit_lines(const SearchResult& result, std::size_t snippet_limit)
  {
    std::vector<std::string> lines;
    lines.reserve(result.memories.size() + result.resources.size());
    for (const auto& memory : result.memories) {
      lines.push_back("[memory] " + truncate_utf8(memory.content, snippet_limit));
    }
    for (const auto& resource : result.resources) {
      lines.push_back(fmt::format("[resource:{}] {}", resource.uri, truncate_utf8(resource.text(), snippet_limit)));
    }
    return lines;
  }

  ServiceConfig config_;
  Bridge<KnowledgeBase> bridge_;
};

// Prepend retrieved context to a user message. Returns message unchanged if
// the service is down or nothing relevant was found.
inline std::string augment_with_context(
  KnowledgeService& service, const std::string& message, std::size_t limit = default_context_limit)
{
  if (!service.ready()) { return message; }
  const std::string context = service.retrieve_context(message, limit);
  if (context.empty()) { return message; }
  return "[The following context was retrieved from the knowledge base for reference]\n" + context
         + "\n[End of context]\n\n" + message;
}

} // namespace kb_bridge
