#pragma once

#include "cdpgate/common/event_loop.hpp"
#include "cdpgate/common/result.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>

namespace cdpgate::common {

enum class BlockingPath {
  /// Work is posted to an already running loop; the caller waits on it.
  ReferencedLoop,
  /// Caller is itself a loop thread and must not block its own loop; the work
  /// runs on a scoped one-shot loop on a dedicated thread.
  ScopedFromLoopThread,
  /// No loop reachable; a scoped one-shot loop lives for this call only.
  ScopedNoLoop,
};

[[nodiscard]] inline BlockingPath select_blocking_path(const EventLoop *referenced) {
  if (EventLoop::current() != nullptr) {
    return BlockingPath::ScopedFromLoopThread;
  }
  if (referenced != nullptr && referenced->is_running()) {
    return BlockingPath::ReferencedLoop;
  }
  return BlockingPath::ScopedNoLoop;
}

template <typename T> using Completion = std::function<void(Result<T>)>;

template <typename T>
using AsyncWork = std::function<void(EventLoop &loop, Completion<T> complete)>;

namespace detail {

// Resolves the future exactly once; if every copy of the completion is dropped
// without being invoked (loop stopped, task discarded) the waiter still wakes.
template <typename T> struct CompletionState {
  std::promise<Result<T>> promise;
  std::atomic<bool> done{false};

  void resolve(Result<T> result) {
    if (!done.exchange(true)) {
      promise.set_value(std::move(result));
    }
  }

  ~CompletionState() {
    resolve(Result<T>::failure(ErrorCode::Protocol, "event loop stopped before completion"));
  }
};

} // namespace detail

/// Run asynchronous `work` to completion from synchronous code. The path is
/// chosen at call time, see BlockingPath.
template <typename T>
[[nodiscard]] Result<T> run_blocking(EventLoop *referenced, AsyncWork<T> work) {
  auto state = std::make_shared<detail::CompletionState<T>>();
  auto future = state->promise.get_future();
  Completion<T> complete = [state](Result<T> result) { state->resolve(std::move(result)); };

  if (select_blocking_path(referenced) == BlockingPath::ReferencedLoop) {
    const bool posted =
        referenced->post([referenced, work, complete = std::move(complete)]() mutable {
          work(*referenced, std::move(complete));
        });
    state.reset();
    if (!posted) {
      return Result<T>::failure(ErrorCode::Protocol, "event loop is not running");
    }
    return future.get();
  }

  EventLoop scoped;
  scoped.start();
  const bool posted = scoped.post([&scoped, work, complete = std::move(complete)]() mutable {
    work(scoped, std::move(complete));
  });
  state.reset();
  if (!posted) {
    return Result<T>::failure(ErrorCode::Protocol, "event loop is not running");
  }
  auto result = future.get();
  scoped.stop();
  return result;
}

} // namespace cdpgate::common
