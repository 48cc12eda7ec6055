#include "cdpgate/common/event_loop.hpp"

namespace cdpgate::common {

namespace {

thread_local EventLoop *t_current_loop = nullptr;

} // namespace

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  stopping_ = false;
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !thread_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    if (std::this_thread::get_id() == thread_.get_id()) {
      // Stopped from one of its own tasks; the worker exits after this task.
      thread_.detach();
    } else {
      thread_.join();
    }
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  timers_ = {};
  tasks_.clear();
}

bool EventLoop::is_running() const { return running_.load(); }

bool EventLoop::post(Task task) {
  if (!task) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool EventLoop::post_after(const std::chrono::milliseconds delay, Task task) {
  if (!task) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
      return false;
    }
    timers_.push(Timer{.due = std::chrono::steady_clock::now() + delay,
                       .sequence = next_sequence_++,
                       .task = std::move(task)});
  }
  cv_.notify_one();
  return true;
}

bool EventLoop::in_loop_thread() const { return t_current_loop == this; }

EventLoop *EventLoop::current() { return t_current_loop; }

void EventLoop::run_loop() {
  t_current_loop = this;
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (!tasks_.empty()) {
      Task task = std::move(tasks_.front());
      tasks_.pop_front();
      lock.unlock();
      task();
      lock.lock();
      continue;
    }
    if (stopping_) {
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    if (!timers_.empty() && timers_.top().due <= now) {
      // top() is const, so the timer is copied out before popping.
      Timer timer = timers_.top();
      timers_.pop();
      lock.unlock();
      timer.task();
      lock.lock();
      continue;
    }

    if (timers_.empty()) {
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
    } else {
      const auto due = timers_.top().due;
      cv_.wait_until(lock, due, [this, due]() {
        return stopping_ || !tasks_.empty() || timers_.empty() || timers_.top().due < due;
      });
    }
  }
  t_current_loop = nullptr;
}

} // namespace cdpgate::common
