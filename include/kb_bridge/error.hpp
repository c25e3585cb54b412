#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace kb_bridge {

enum class ErrorKind : std::uint8_t {
  NotReady, // Backend never initialized or bridge closed; nothing was queued
  Timeout, // Caller stopped waiting; the call still runs later
  BackendFailure, // The operation threw on the worker
  BackendUnavailable // The worker's backend failed to initialize
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
  case ErrorKind::NotReady:
    return "not ready";
  case ErrorKind::Timeout:
    return "timed out";
  case ErrorKind::BackendFailure:
    return "backend failure";
  case ErrorKind::BackendUnavailable:
    return "backend unavailable";
  }
  return "unknown";
}

struct CallError
{
  ErrorKind kind;
  std::string operation;
  std::string message;

  [[nodiscard]] std::string describe() const
  {
    std::string text = operation + ": " + std::string(to_string(kind));
    if (!message.empty()) { text += " (" + message + ")"; }
    return text;
  }
};

template<typename T> using Outcome = std::expected<T, CallError>;

// Thrown by KnowledgeBase implementations
class BackendError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Thrown while loading or validating configuration
class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(std::string key, const std::string& reason)
    : std::runtime_error("invalid config '" + key + "': " + reason), key_(std::move(key))
  {}

  [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
  std::string key_;
};

} // namespace kb_bridge
