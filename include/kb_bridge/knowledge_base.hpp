#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kb_bridge {

// =============================================================================
// Backend result schema
// =============================================================================

struct MemoryHit
{
  std::string content;
};

struct ResourceHit
{
  std::string uri;
  std::string abstract;
  std::optional<std::string> content;
  std::optional<std::string> title;

  // content when present and non-empty, else the abstract
  [[nodiscard]] const std::string& text() const noexcept
  {
    return content && !content->empty() ? *content : abstract;
  }

  [[nodiscard]] const std::string& display_title() const noexcept { return title ? *title : uri; }
};

struct SearchResult
{
  std::size_t total = 0; // Backend-side match count, may exceed the hits returned
  std::vector<MemoryHit> memories;
  std::vector<ResourceHit> resources;

  [[nodiscard]] bool empty() const noexcept { return memories.empty() && resources.empty(); }
};

struct AddResourceResult
{
  std::string status;
  std::vector<std::string> errors;
  std::string root_uri;
};

struct DirectoryEntry
{
  std::string name;
  bool is_dir = false;
  std::uint64_t size = 0;
};

struct SessionInfo
{
  std::string session_id;
};

// =============================================================================
// KnowledgeBase - the engine behind the bridge
// Implementations are not thread-safe and may block for a long time; only the
// bridge worker calls them. Failures are reported by throwing.
// =============================================================================

class KnowledgeBase
{
public:
  KnowledgeBase() = default;
  virtual ~KnowledgeBase() = default;

  KnowledgeBase(const KnowledgeBase&) = delete;
  KnowledgeBase& operator=(const KnowledgeBase&) = delete;
  KnowledgeBase(KnowledgeBase&&) = delete;
  KnowledgeBase& operator=(KnowledgeBase&&) = delete;

  virtual void initialize() = 0;

  virtual SearchResult search(const std::string& query, std::size_t limit) = 0;

  // Recursive directory retrieval; same result shape as search()
  virtual SearchResult find(const std::string& query, std::size_t limit) = 0;

  // wait: block until indexing finishes, for at most timeout
  virtual AddResourceResult add_resource(const std::string& path, bool wait, std::chrono::milliseconds timeout) = 0;

  virtual std::vector<DirectoryEntry> list_directory(const std::string& uri) = 0;
  virtual std::string read(const std::string& uri) = 0;
  virtual std::string abstract(const std::string& uri) = 0;
  virtual std::vector<SessionInfo> list_sessions() = 0;

  virtual void close() = 0;
};

} // namespace kb_bridge
