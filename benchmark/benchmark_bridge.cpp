#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <kb_bridge/bridge.hpp>
#include <kb_bridge/log.hpp>
#include <kb_bridge/pending_call.hpp>
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <vector>

namespace {

constexpr int kRoundTrips = 100000;
constexpr int kPipelined = 200000;
constexpr auto kWait = std::chrono::seconds(30);
constexpr auto kIdlePoll = std::chrono::milliseconds(100);

template<typename Count, typename Duration> auto calls_per_second(Count call_count, Duration elapsed) -> long long
{
  using seconds_double = std::chrono::duration<double>;
  const auto seconds = std::chrono::duration_cast<seconds_double>(elapsed).count();
  return static_cast<long long>(static_cast<double>(call_count) / seconds);
}

// Cheapest possible backend so the numbers measure the bridge itself
struct Counter
{
  std::uint64_t value = 0;
  void initialize() {}
  void close() {}
};

using CounterBridge = kb_bridge::Bridge<Counter>;

std::unique_ptr<CounterBridge> started_bridge()
{
  auto bridge = std::make_unique<CounterBridge>([] { return std::make_unique<Counter>(); }, kIdlePoll);
  bridge->start();
  if (!bridge->wait_until_ready(kWait)) { fmt::print(stderr, "backend did not start\n"); }
  return bridge;
}

} // namespace

// =============================================================================
// Benchmark 1: one caller, submit and wait for every call
// =============================================================================

void benchmark_round_trip()
{
  fmt::print("=== Benchmark 1: blocking round trips, 1 caller ===\n");
  using namespace std::chrono;

  auto bridge = started_bridge();
  int failures = 0;
  const auto started = steady_clock::now();
  for (int i = 0; i < kRoundTrips; ++i) {
    if (!bridge->call("bump", kWait, [](Counter& counter) { return ++counter.value; })) { ++failures; }
  }
  const auto elapsed = steady_clock::now() - started;
  fmt::print("  {} calls/sec ({} failed)\n\n", calls_per_second(kRoundTrips, elapsed), failures);
}

// =============================================================================
// Benchmark 2: one caller, submit everything then collect
// =============================================================================

void benchmark_pipelined()
{
  fmt::print("=== Benchmark 2: pipelined submissions, 1 caller ===\n");
  using namespace std::chrono;

  auto bridge = started_bridge();
  std::vector<kb_bridge::Ticket<std::uint64_t>> tickets;
  tickets.reserve(kPipelined);

  const auto started = steady_clock::now();
  for (int i = 0; i < kPipelined; ++i) {
    tickets.push_back(bridge->submit("bump", [](Counter& counter) { return ++counter.value; }));
  }
  std::uint64_t last = 0;
  for (auto& ticket : tickets) {
    if (auto outcome = ticket.wait_for(kWait)) { last = *outcome; }
  }
  const auto elapsed = steady_clock::now() - started;
  fmt::print("  {} calls/sec (last value {})\n\n", calls_per_second(kPipelined, elapsed), last);
}

// =============================================================================
// Benchmark 3: N callers contending for the one worker
// =============================================================================

void benchmark_contended(int callers)
{
  fmt::print("=== Benchmark 3: blocking round trips, {} callers ===\n", callers);
  using namespace std::chrono;

  auto bridge = started_bridge();
  std::atomic<int> failures{ 0 };
  const int per_caller = kRoundTrips / callers;

  const auto started = steady_clock::now();
  std::vector<std::thread> threads;
  threads.reserve(static_cast<std::size_t>(callers));
  for (int t = 0; t < callers; ++t) {
    threads.emplace_back([&bridge, &failures, per_caller] {
      for (int i = 0; i < per_caller; ++i) {
        if (!bridge->call("bump", kWait, [](Counter& counter) { return ++counter.value; })) {
          failures.fetch_add(1, std::memory_order_relaxed);
        }
      }
    });
  }
  for (auto& thread : threads) { thread.join(); }
  const auto elapsed = steady_clock::now() - started;
  fmt::print("  {} calls/sec ({} failed)\n\n", calls_per_second(per_caller * callers, elapsed), failures.load());
}

// NOLINTNEXTLINE(bugprone-exception-escape) - fmt::print may throw but we accept that in benchmarks
int main()
{
  // Lifecycle chatter would dominate the output
  kb_bridge::logger()->set_level(spdlog::level::warn);

  fmt::print("\n");
  benchmark_round_trip();
  benchmark_pipelined();
  benchmark_contended(2);
  benchmark_contended(4);
  benchmark_contended(8);
  return 0;
}
