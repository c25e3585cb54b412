#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "error.hpp"
#include "log.hpp"
#include "pending_call.hpp"
#include "worker.hpp"

namespace kb_bridge {

namespace detail {

// Timeouts and failures are logged where the caller gives up or observes them;
// NotReady was already logged at submission
inline void log_unfinished(const CallError& error, std::chrono::milliseconds timeout)
{
  if (error.kind == ErrorKind::Timeout) {
    logger()->warn("{} timed out after {}ms", error.operation, timeout.count());
  } else if (error.kind != ErrorKind::NotReady) {
    logger()->error("{}", error.describe());
  }
}

} // namespace detail

// =============================================================================
// Bridge - serializes calls from any number of threads onto one worker
// =============================================================================

template<typename Backend> class Bridge
{
public:
  using backend_factory = typename Worker<Backend>::backend_factory;

  explicit Bridge(backend_factory factory, std::chrono::milliseconds idle_poll = default_idle_poll)
    : worker_(std::move(factory), idle_poll)
  {}

  ~Bridge()
  {
    close();
    join();
  }

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;
  Bridge(Bridge&&) = delete;
  Bridge& operator=(Bridge&&) = delete;

  // Launches the worker; the backend is built on the worker thread
  void start()
  {
    if (closed_.load(std::memory_order_acquire)) {
      logger()->warn("start() on a closed bridge ignored");
      return;
    }
    worker_.start();
  }

  [[nodiscard]] bool ready() const noexcept { return !closed_.load(std::memory_order_acquire) && worker_.ready(); }

  template<typename Rep, typename Period> bool wait_until_ready(std::chrono::duration<Rep, Period> timeout)
  {
    if (!worker_.started()) { return false; }
    return worker_.wait_until_ready(timeout) && ready();
  }

  // Queue fn for the worker and return immediately. Refused with NotReady
  // (nothing queued) unless the backend is up and the bridge is open.
  template<typename F> [[nodiscard]] auto submit(std::string name, F&& fn) -> Ticket<std::invoke_result_t<F&, Backend&>>
  {
    using R = std::invoke_result_t<F&, Backend&>;
    if (!ready()) {
      logger()->warn("{} refused: backend not ready", name);
      return Ticket<R>(CallError{ ErrorKind::NotReady, std::move(name), "backend not initialized" });
    }
    auto call = std::make_unique<TypedCall<Backend, R>>(Operation<Backend, R>{ name, std::forward<F>(fn) });
    auto completion = call->completion();
    worker_.enqueue(std::move(call));
    return Ticket<R>(std::move(name), std::move(completion));
  }

  // Submit and wait up to timeout. A timed-out call stays queued and still
  // runs; its result is dropped.
  template<typename F, typename Rep, typename Period>
  [[nodiscard]] auto call(std::string name, std::chrono::duration<Rep, Period> timeout, F&& fn)
    -> Outcome<std::invoke_result_t<F&, Backend&>>
  {
    auto ticket = submit(std::move(name), std::forward<F>(fn));
    auto outcome = ticket.wait_for(timeout);
    if (!outcome) {
      detail::log_unfinished(outcome.error(), std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    }
    return outcome;
  }

  // Idempotent and non-blocking. Calls already queued drain before the
  // worker honors the sentinel and closes the backend.
  void close()
  {
    if (closed_.exchange(true)) { return; }
    if (!worker_.started()) { return; }
    logger()->info("shutdown requested, {} calls queued", worker_.pending());
    worker_.request_stop();
  }

  void join() { worker_.join(); }

  [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

  [[nodiscard]] const Worker<Backend>& worker() const noexcept { return worker_; }

private:
  Worker<Backend> worker_;
  std::atomic<bool> closed_{ false };
};

} // namespace kb_bridge
