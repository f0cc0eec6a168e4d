#ifndef CLOCKSIM_PLAY_TIMER_H
#define CLOCKSIM_PLAY_TIMER_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>

#include "common/macros.h"

/**
 * PlayTimer calls a callback on a background thread once per interval.
 *
 * The loop ends when Stop() is called or when the callback returns false.
 * Stop() joins the worker, so it must not be called while holding a lock
 * the callback needs, nor from inside the callback.
 */
class PlayTimer {
 public:
  using TickCallback = std::function<bool()>;

  explicit PlayTimer(TickCallback callback) : callback_(std::move(callback)) {}

  ~PlayTimer() { Stop(); }

  DISALLOW_COPY_AND_MOVE(PlayTimer);

  void Start(std::chrono::milliseconds interval);

  void Stop();

  bool IsRunning();

 private:
  void Run();

  TickCallback callback_;
  std::chrono::milliseconds interval_{0};
  std::mutex latch_;
  std::condition_variable cv_;
  bool running_{false};
  std::thread worker_;
};

#endif  // CLOCKSIM_PLAY_TIMER_H
