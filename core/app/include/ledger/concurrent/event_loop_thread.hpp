#pragma once

#include "ledger/concurrent/thread_safe_queue.hpp"
#include "ledger/eventbus/event_bus.hpp"
#include "ledger/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// EventLoopThread: the ledger's notification loop
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on an owned EventBus.
//
// @details
// Ledger operations run synchronously on the caller's thread. After a unit of
// work commits, the coordinator hands the commit's events to push_all(), and
// subscribers (the IPC telemetry bridge, tests, loggers) receive them here,
// off the caller's thread and outside every batch lock.
//
// Events from one commit are enqueued together and delivered in order.
// Events from different batches may interleave.
//
// stop() delivers whatever is still queued before joining, so a subscriber
// sees every event of every commit that returned before stop() was called.
//
// Thread model:
//   start(), stop(), push() and push_all() are safe from any thread.
//   Subscriber callbacks run only on the loop thread.
//
// Ownership:
//   Owned by LedgerEngine as a value member.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Flushes the queue on the loop thread, then joins.
  void stop();

  bool running() const { return running_.load(); }

  void push(Event event);
  void push_all(std::vector<Event> events);

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};

  // Paired with wake_cv_. The worker sleeps on it when the queue is empty;
  // push and stop notify it.
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::thread thread_;
};

}  // namespace ledger
