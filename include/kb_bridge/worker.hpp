#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

#include "dispatch_queue.hpp"
#include "error.hpp"
#include "log.hpp"
#include "pending_call.hpp"

namespace kb_bridge {

enum class WorkerState : std::uint8_t {
  Uninitialized, // Thread not started or backend not built yet
  Ready, // Backend initialized, nothing executed yet
  Running, // Serving calls
  Faulted, // Backend initialization failed; queued calls are failed until stopped
  Stopped // Sentinel consumed, backend closed, thread finished
};

[[nodiscard]] constexpr std::string_view to_string(WorkerState state) noexcept
{
  switch (state) {
  case WorkerState::Uninitialized:
    return "uninitialized";
  case WorkerState::Ready:
    return "ready";
  case WorkerState::Running:
    return "running";
  case WorkerState::Faulted:
    return "faulted";
  case WorkerState::Stopped:
    return "stopped";
  }
  return "unknown";
}

// Sentinel: once dequeued the worker processes nothing else
struct StopRequest
{
};

inline constexpr std::chrono::milliseconds default_idle_poll{ 1000 };

// =============================================================================
// Worker - the single thread allowed to touch the backend
// =============================================================================

template<typename Backend> class Worker
{
public:
  using backend_factory = std::function<std::unique_ptr<Backend>()>;
  using call_ptr = std::unique_ptr<PendingCall<Backend>>;
  using item_type = std::variant<StopRequest, call_ptr>;

  explicit Worker(backend_factory factory, std::chrono::milliseconds idle_poll = default_idle_poll)
    : factory_(std::move(factory)), idle_poll_(idle_poll)
  {}

  ~Worker()
  {
    if (thread_.joinable()) {
      request_stop();
      thread_.join();
    }
  }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

  // Starts at most once; a stopped worker is never restarted
  void start()
  {
    if (started_.exchange(true)) { return; }
    thread_ = std::thread([this] { run_loop(); });
  }

  void enqueue(call_ptr call) { queue_.push(item_type{ std::move(call) }); }

  // Calls queued before the sentinel still run
  void request_stop() { queue_.push(item_type{ StopRequest{} }); }

  void join()
  {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) { thread_.join(); }
  }

  // Blocks until the backend is initialized, failed to initialize, or timeout expires
  template<typename Rep, typename Period> bool wait_until_ready(std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this] { return state_.load() != WorkerState::Uninitialized; });
    return ready_.load(std::memory_order_acquire);
  }

  [[nodiscard]] bool started() const noexcept { return started_.load(std::memory_order_acquire); }
  [[nodiscard]] bool ready() const noexcept { return ready_.load(std::memory_order_acquire); }
  [[nodiscard]] WorkerState state() const noexcept { return state_.load(std::memory_order_acquire); }
  [[nodiscard]] std::size_t executed() const noexcept { return executed_.load(std::memory_order_relaxed); }
  [[nodiscard]] std::size_t pending() const { return queue_.size(); }

private:
  void run_loop()
  {
    std::unique_ptr<Backend> backend = initialize_backend();

    bool stop = false;
    while (!stop) {
      try {
        auto item = queue_.pop_wait_for(idle_poll_);
        if (!item) {
          logger()->debug("worker idle, {} calls executed", executed());
          continue;
        }
        if (std::holds_alternative<StopRequest>(*item)) {
          stop = true;
        } else {
          execute(*std::get<call_ptr>(*item), backend.get());
        }
      } catch (const std::exception& fault) {
        logger()->error("worker loop fault: {}", fault.what());
      }
    }

    ready_.store(false, std::memory_order_release);
    close_backend(backend);
    set_state(WorkerState::Stopped);
    logger()->info("worker stopped after {} calls", executed());
  }

  std::unique_ptr<Backend> initialize_backend()
  {
    try {
      auto backend = factory_();
      if (!backend) { throw BackendError("backend factory returned nothing"); }
      backend->initialize();
      ready_.store(true, std::memory_order_release);
      set_state(WorkerState::Ready);
      logger()->info("backend initialized");
      return backend;
    } catch (const std::exception& failure) {
      init_error_ = failure.what();
    } catch (...) {
      init_error_ = "unknown error";
    }
    set_state(WorkerState::Faulted);
    logger()->error("backend initialization failed: {}", init_error_);
    return nullptr;
  }

  void execute(PendingCall<Backend>& call, Backend* backend)
  {
    if (backend == nullptr) {
      call.fail(CallError{ ErrorKind::BackendUnavailable, call.name(), init_error_ });
      return;
    }
    if (state() == WorkerState::Ready) { set_state(WorkerState::Running); }
    logger()->debug("executing {}", call.name());
    call.run(*backend);
    executed_.fetch_add(1, std::memory_order_relaxed);
  }

  void close_backend(std::unique_ptr<Backend>& backend)
  {
    if (!backend) { return; }
    try {
      backend->close();
    } catch (const std::exception& failure) {
      logger()->error("backend close failed: {}", failure.what());
    }
    backend.reset();
  }

  void set_state(WorkerState next)
  {
    {
      std::scoped_lock lock(state_mutex_);
      state_.store(next, std::memory_order_release);
    }
    state_cv_.notify_all();
  }

  backend_factory factory_;
  std::chrono::milliseconds idle_poll_;
  DispatchQueue<item_type> queue_;
  std::thread thread_;
  std::string init_error_; // Written and read on the worker thread only
  std::atomic<bool> started_{ false };
  std::atomic<bool> ready_{ false };
  std::atomic<WorkerState> state_{ WorkerState::Uninitialized };
  std::atomic<std::size_t> executed_{ 0 };
  std::mutex state_mutex_;
  std::condition_variable state_cv_;
};

} // namespace kb_bridge
