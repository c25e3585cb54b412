// NOLINTBEGIN(misc-include-cleaner)
#include <catch2/catch.hpp>
#include <chrono>
#include <kb_bridge/bridge.hpp>
#include <kb_bridge/knowledge_base.hpp>
#include <kb_bridge/log.hpp>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>

#include "test_utils.hpp"
// NOLINTEND(misc-include-cleaner)

TEST_CASE("set_logger routes library messages to the application's sink", "[log]")
{
  std::ostringstream captured;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
  auto custom = std::make_shared<spdlog::logger>("application", sink);
  custom->set_pattern("%l %v");

  kb_bridge::set_logger(custom);
  REQUIRE(kb_bridge::logger()->name() == "kb_bridge");

  {
    kb_bridge::Bridge<kb_bridge::KnowledgeBase> bridge(mock_factory(std::make_shared<MockState>()));
    auto outcome = bridge.call("search", std::chrono::milliseconds(10), [](kb_bridge::KnowledgeBase& kb) {
      return kb.search("q", 1);
    });
    REQUIRE_FALSE(outcome.has_value());
  }
  kb_bridge::logger()->flush();
  REQUIRE(captured.str().find("warning search refused: backend not ready") != std::string::npos);

  kb_bridge::set_logger(std::make_shared<spdlog::logger>(
    kb_bridge::logger_name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
}

TEST_CASE("set_logger rejects a null logger and keeps the current one", "[log]")
{
  const auto before = kb_bridge::logger();
  REQUIRE_THROWS_AS(kb_bridge::set_logger(nullptr), std::invalid_argument);
  REQUIRE(kb_bridge::logger() == before);
}
