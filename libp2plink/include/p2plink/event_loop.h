/**
 * @file event_loop.h
 * @brief Ordered message queue with delayed delivery
 */

#ifndef P2PLINK_EVENT_LOOP_H
#define P2PLINK_EVENT_LOOP_H

#include "message.h"
#include "platform.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace p2plink {

// ============================================================================
// Clocks
// ============================================================================

class Clock {
public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class P2PLINK_API SteadyClock : public Clock {
public:
  TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 */
class P2PLINK_API ManualClock : public Clock {
public:
  TimePoint now() const override;
  void advance(std::chrono::milliseconds delta);

private:
  mutable std::mutex mutex_;
  TimePoint now_{};
};

// ============================================================================
// Event Loop
// ============================================================================

/**
 * @brief FIFO of messages consumed by one thread
 *
 * Posting is thread-safe. Delayed messages become ready, in due order,
 * once the clock reaches their due time; ready messages keep posting
 * order.
 */
class P2PLINK_API EventLoop {
public:
  using Handler = std::function<void(const Message &)>;

  explicit EventLoop(std::shared_ptr<Clock> clock = nullptr);
  ~EventLoop();

  // Non-copyable
  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  void post(Message msg);
  void post_delayed(Message msg, std::chrono::milliseconds delay);

  /// Insert @p msgs ahead of every ready message, keeping their order
  void post_front(std::vector<Message> msgs);

  /**
   * @brief Best-effort removal of queued messages
   * @return Number of ready and delayed messages removed
   */
  size_t remove(Cmd what);

  /**
   * @brief Handle every message that is ready now
   *
   * Messages posted by @p handler are handled too if they are ready.
   * @return Number of messages handled
   */
  size_t dispatch_pending(const Handler &handler);

  /// Handle messages until quit() is called
  void run(const Handler &handler);
  void quit();

  size_t pending_count() const;
  size_t delayed_count() const;

  const Clock &clock() const { return *clock_; }

private:
  bool take_ready_locked(Message &out);
  void promote_due_locked();

  std::shared_ptr<Clock> clock_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Message> ready_;
  std::multimap<Clock::TimePoint, Message> delayed_;
  bool quit_ = false;
};

} // namespace p2plink

#endif // P2PLINK_EVENT_LOOP_H
