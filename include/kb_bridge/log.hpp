#pragma once

#include <memory>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace kb_bridge {

inline constexpr const char* logger_name = "kb_bridge";

// Install an application-provided logger under the library's name.
// Throws std::invalid_argument for a null logger.
inline void set_logger(std::shared_ptr<spdlog::logger> custom)
{
  if (!custom) { throw std::invalid_argument("set_logger: null logger"); }
  spdlog::drop(logger_name);
  if (custom->name() != logger_name) { custom = custom->clone(logger_name); }
  spdlog::register_logger(std::move(custom));
}

// Library logger, created with a stderr sink on first use unless set_logger() ran first
inline std::shared_ptr<spdlog::logger> logger()
{
  static std::once_flag created;
  std::call_once(created, [] {
    if (!spdlog::get(logger_name)) {
      auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      spdlog::register_logger(std::make_shared<spdlog::logger>(logger_name, std::move(sink)));
    }
  });
  if (auto registered = spdlog::get(logger_name)) { return registered; }
  return spdlog::default_logger();
}

} // namespace kb_bridge
