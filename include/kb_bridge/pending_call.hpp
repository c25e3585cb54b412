#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "error.hpp"

namespace kb_bridge {

namespace detail {

// Carries a CallError through a promise when the worker completes a call without running it
class CallAborted : public std::runtime_error
{
public:
  explicit CallAborted(CallError error) : std::runtime_error(error.message), error_(std::move(error)) {}

  [[nodiscard]] const CallError& error() const noexcept { return error_; }

private:
  CallError error_;
};

} // namespace detail

// =============================================================================
// Operation - one named unit of backend work, arguments already bound
// =============================================================================

template<typename Backend, typename R> struct Operation
{
  std::string name;
  std::function<R(Backend&)> fn;
};

// =============================================================================
// PendingCall - the worker's side of one in-flight operation
// Completed exactly once, by run() or fail(), on the worker thread.
// =============================================================================

template<typename Backend> class PendingCall
{
public:
  PendingCall() = default;
  virtual ~PendingCall() = default;

  PendingCall(const PendingCall&) = delete;
  PendingCall& operator=(const PendingCall&) = delete;
  PendingCall(PendingCall&&) = delete;
  PendingCall& operator=(PendingCall&&) = delete;

  [[nodiscard]] virtual const std::string& name() const noexcept = 0;

  // Execute against the backend and publish the result or the thrown exception
  virtual void run(Backend& backend) = 0;

  // Publish an error without executing
  virtual void fail(CallError error) = 0;
};

template<typename Backend, typename R> class TypedCall final : public PendingCall<Backend>
{
public:
  explicit TypedCall(Operation<Backend, R> operation) : operation_(std::move(operation)) {}

  [[nodiscard]] std::shared_future<R> completion() { return promise_.get_future().share(); }

  [[nodiscard]] const std::string& name() const noexcept override { return operation_.name; }

  void run(Backend& backend) override
  {
    try {
      if constexpr (std::is_void_v<R>) {
        operation_.fn(backend);
        promise_.set_value();
      } else {
        promise_.set_value(operation_.fn(backend));
      }
    } catch (...) {
      // Handed to the waiting caller, who converts it to a BackendFailure
      promise_.set_exception(std::current_exception());
    }
  }

  void fail(CallError error) override
  {
    promise_.set_exception(std::make_exception_ptr(detail::CallAborted(std::move(error))));
  }

private:
  Operation<Backend, R> operation_;
  std::promise<R> promise_;
};

// =============================================================================
// Ticket - the caller's read-only view of a PendingCall
// =============================================================================

template<typename R> class Ticket
{
public:
  Ticket(std::string operation, std::shared_future<R> completion)
    : operation_(std::move(operation)), completion_(std::move(completion))
  {}

  // A ticket that was refused before reaching the queue
  explicit Ticket(CallError refused) : operation_(refused.operation), refused_(std::move(refused)) {}

  [[nodiscard]] const std::string& operation() const noexcept { return operation_; }

  [[nodiscard]] bool is_done() const
  {
    if (refused_) { return true; }
    return completion_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  }

  // Blocks only the calling thread. Waiting again after a timeout is allowed.
  template<typename Rep, typename Period>
  [[nodiscard]] Outcome<R> wait_for(std::chrono::duration<Rep, Period> timeout) const
  {
    if (refused_) { return std::unexpected(*refused_); }
    if (completion_.wait_for(timeout) != std::future_status::ready) {
      return std::unexpected(CallError{ ErrorKind::Timeout, operation_, {} });
    }
    return collect();
  }

private:
  [[nodiscard]] Outcome<R> collect() const
  {
    try {
      if constexpr (std::is_void_v<R>) {
        completion_.get();
        return {};
      } else {
        return completion_.get();
      }
    } catch (const detail::CallAborted& aborted) {
      return std::unexpected(aborted.error());
    } catch (const std::exception& failure) {
      return std::unexpected(CallError{ ErrorKind::BackendFailure, operation_, failure.what() });
    } catch (...) {
      return std::unexpected(CallError{ ErrorKind::BackendFailure, operation_, "unknown error" });
    }
  }

  std::string operation_;
  std::shared_future<R> completion_;
  std::optional<CallError> refused_;
};

} // namespace kb_bridge
