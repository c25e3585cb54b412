#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <kb_bridge/error.hpp>
#include <kb_bridge/knowledge_base.hpp>
#include <kb_bridge/log.hpp>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// =============================================================================
// InMemoryKnowledgeBase - toy engine for the demo
// Substring matching over a handful of memories and documents. Like a real
// engine it refuses to be entered from two threads at once: a nested or
// concurrent call throws instead of corrupting state.
// =============================================================================

class InMemoryKnowledgeBase final : public kb_bridge::KnowledgeBase
{
public:
  static constexpr std::string_view resource_root = "kb://resources/";

  explicit InMemoryKnowledgeBase(std::filesystem::path data_dir) : data_dir_(std::move(data_dir)) {}

  void add_memory(std::string content) { memories_.push_back(std::move(content)); }

  void add_document(const std::string& name, std::string content)
  {
    documents_[std::string(resource_root) + name] = std::move(content);
  }

  void initialize() override
  {
    const Entry entry(*this);
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) { throw kb_bridge::BackendError("cannot create " + data_dir_.string() + ": " + ec.message()); }
    sessions_.push_back("session-" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    kb_bridge::logger()->debug("in-memory knowledge base ready at {}", data_dir_.string());
  }

  kb_bridge::SearchResult search(const std::string& query, std::size_t limit) override
  {
    const Entry entry(*this);
    return match(query, limit, false);
  }

  kb_bridge::SearchResult find(const std::string& query, std::size_t limit) override
  {
    const Entry entry(*this);
    return match(query, limit, true);
  }

  kb_bridge::AddResourceResult add_resource(
    const std::string& path, bool /*wait*/, std::chrono::milliseconds /*timeout*/) override
  {
    const Entry entry(*this);
    std::ifstream input(path, std::ios::binary);
    if (!input) { return { .status = "error", .errors = { "cannot open " + path }, .root_uri = {} }; }

    std::ostringstream content;
    content << input.rdbuf();
    const std::string name = std::filesystem::path(path).filename().string();
    const std::string uri = std::string(resource_root) + name;
    documents_[uri] = content.str();
    return { .status = "success", .errors = {}, .root_uri = uri };
  }

  std::vector<kb_bridge::DirectoryEntry> list_directory(const std::string& uri) override
  {
    const Entry entry(*this);
    std::map<std::string, kb_bridge::DirectoryEntry> children;
    for (const auto& [doc_uri, content] : documents_) {
      if (!doc_uri.starts_with(uri) || doc_uri.size() == uri.size()) { continue; }
      const std::string rest = doc_uri.substr(uri.size());
      const auto slash = rest.find('/');
      if (slash == std::string::npos) {
        children[rest] = { .name = rest, .is_dir = false, .size = content.size() };
      } else {
        const std::string dir = rest.substr(0, slash);
        children.try_emplace(dir, kb_bridge::DirectoryEntry{ .name = dir, .is_dir = true, .size = 0 });
      }
    }

    std::vector<kb_bridge::DirectoryEntry> entries;
    entries.reserve(children.size());
    std::ranges::transform(children, std::back_inserter(entries), [](const auto& child) { return child.second; });
    return entries;
  }

  std::string read(const std::string& uri) override
  {
    const Entry entry(*this);
    return document(uri);
  }

  std::string abstract(const std::string& uri) override
  {
    const Entry entry(*this);
    const std::string& content = document(uri);
    return first_line(content);
  }

  std::vector<kb_bridge::SessionInfo> list_sessions() override
  {
    const Entry entry(*this);
    std::vector<kb_bridge::SessionInfo> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& id : sessions_) { sessions.push_back({ id }); }
    return sessions;
  }

  void close() override
  {
    const Entry entry(*this);
    kb_bridge::logger()->debug("in-memory knowledge base closed with {} documents", documents_.size());
  }

private:
  // Marks the engine busy for the duration of a call
  class Entry
  {
  public:
    explicit Entry(InMemoryKnowledgeBase& kb) : kb_(kb)
    {
      if (kb_.busy_) { throw kb_bridge::BackendError("knowledge base entered concurrently"); }
      kb_.busy_ = true;
    }
    ~Entry() { kb_.busy_ = false; }

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;
    Entry(Entry&&) = delete;
    Entry& operator=(Entry&&) = delete;

  private:
    InMemoryKnowledgeBase& kb_;
  };

  static std::string lowered(std::string_view text)
  {
    std::string out(text);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

  static bool contains(std::string_view haystack, const std::string& needle)
  {
    return lowered(haystack).find(needle) != std::string::npos;
  }

  static std::string first_line(const std::string& content)
  {
    return content.substr(0, content.find('\n'));
  }

  [[nodiscard]] const std::string& document(const std::string& uri) const
  {
    const auto found = documents_.find(uri);
    if (found == documents_.end()) { throw kb_bridge::BackendError("no such resource: " + uri); }
    return found->second;
  }

  // find also looks at resource names, search only at content
  [[nodiscard]] kb_bridge::SearchResult match(const std::string& query, std::size_t limit, bool deep) const
  {
    const std::string needle = lowered(query);
    kb_bridge::SearchResult result;
    for (const auto& memory : memories_) {
      if (!contains(memory, needle)) { continue; }
      ++result.total;
      if (result.memories.size() < limit) { result.memories.push_back({ memory }); }
    }
    for (const auto& [uri, content] : documents_) {
      if (!contains(content, needle) && !(deep && contains(uri, needle))) { continue; }
      ++result.total;
      if (result.resources.size() < limit) {
        result.resources.push_back({ .uri = uri,
          .abstract = first_line(content),
          .content = content,
          .title = std::filesystem::path(uri).filename().string() });
      }
    }
    return result;
  }

  std::filesystem::path data_dir_;
  std::vector<std::string> memories_;
  std::map<std::string, std::string> documents_;
  std::vector<std::string> sessions_;
  bool busy_ = false;
};
