#include "ledger/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace ledger {

namespace {

// Upper bound on how long an idle worker sleeps before re-checking the queue.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// push / push_all
// -----------------------------------------------------------------------------
void EventLoopThread::push(Event event) {
  queue_.push(std::move(event));
  wake_cv_.notify_one();
}

void EventLoopThread::push_all(std::vector<Event> events) {
  queue_.push_all(std::move(events));
  wake_cv_.notify_one();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (std::optional<Event> event = queue_.try_pop()) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }

  // Final flush: events of commits that completed before stop().
  for (const Event& event : queue_.drain()) {
    bus_.publish(event);
  }
}

}  // namespace ledger
