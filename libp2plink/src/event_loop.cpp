/**
 * @file event_loop.cpp
 * @brief Message queue implementation
 */

#include "p2plink/event_loop.h"

namespace p2plink {

// ============================================================================
// Manual Clock
// ============================================================================

Clock::TimePoint ManualClock::now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

// ============================================================================
// Event Loop
// ============================================================================

EventLoop::EventLoop(std::shared_ptr<Clock> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = std::make_shared<SteadyClock>();
  }
}

EventLoop::~EventLoop() = default;

void EventLoop::post(Message msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.push_back(std::move(msg));
  }
  cv_.notify_one();
}

void EventLoop::post_delayed(Message msg, std::chrono::milliseconds delay) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    delayed_.emplace(clock_->now() + delay, std::move(msg));
  }
  cv_.notify_one();
}

void EventLoop::post_front(std::vector<Message> msgs) {
  if (msgs.empty()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = msgs.rbegin(); it != msgs.rend(); ++it) {
      ready_.push_front(std::move(*it));
    }
  }
  cv_.notify_one();
}

size_t EventLoop::remove(Cmd what) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;

  for (auto it = ready_.begin(); it != ready_.end();) {
    if (it->what == what) {
      it = ready_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  for (auto it = delayed_.begin(); it != delayed_.end();) {
    if (it->second.what == what) {
      it = delayed_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void EventLoop::promote_due_locked() {
  auto now = clock_->now();
  while (!delayed_.empty() && delayed_.begin()->first <= now) {
    ready_.push_back(std::move(delayed_.begin()->second));
    delayed_.erase(delayed_.begin());
  }
}

bool EventLoop::take_ready_locked(Message &out) {
  promote_due_locked();
  if (ready_.empty()) {
    return false;
  }
  out = std::move(ready_.front());
  ready_.pop_front();
  return true;
}

size_t EventLoop::dispatch_pending(const Handler &handler) {
  size_t handled = 0;
  for (;;) {
    Message msg;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!take_ready_locked(msg)) {
        break;
      }
    }
    handler(msg);
    ++handled;
  }
  return handled;
}

void EventLoop::run(const Handler &handler) {
  for (;;) {
    Message msg;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      for (;;) {
        if (quit_) {
          // A quit() that raced ahead of run() still counts, once
          quit_ = false;
          return;
        }
        if (take_ready_locked(msg)) {
          break;
        }
        if (delayed_.empty()) {
          cv_.wait(lock);
        } else {
          auto wait = delayed_.begin()->first - clock_->now();
          cv_.wait_for(lock, wait);
        }
      }
    }
    handler(msg);
  }
}

void EventLoop::quit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    quit_ = true;
  }
  cv_.notify_all();
}

size_t EventLoop::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_.size();
}

size_t EventLoop::delayed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delayed_.size();
}

} // namespace p2plink
