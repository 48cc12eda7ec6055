#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace cdpgate::common {

/// Single-threaded task scheduler with delayed tasks. All tasks posted to one
/// loop run sequentially on its worker thread.
class EventLoop {
public:
  using Task = std::function<void()>;

  EventLoop() = default;
  ~EventLoop();

  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void start();
  /// Runs tasks already queued, drops pending timers, then joins the worker.
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Returns false when the loop is not running; the task is dropped.
  bool post(Task task);
  bool post_after(std::chrono::milliseconds delay, Task task);

  [[nodiscard]] bool in_loop_thread() const;

  /// Loop bound to the calling thread, or nullptr off any loop.
  [[nodiscard]] static EventLoop *current();

private:
  struct Timer {
    std::chrono::steady_clock::time_point due;
    std::uint64_t sequence = 0;
    Task task;
  };
  struct TimerLater {
    bool operator()(const Timer &a, const Timer &b) const {
      return a.due != b.due ? a.due > b.due : a.sequence > b.sequence;
    }
  };

  void run_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  std::priority_queue<Timer, std::vector<Timer>, TimerLater> timers_;
  std::uint64_t next_sequence_ = 0;
  std::atomic<bool> running_{false};
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace cdpgate::common
