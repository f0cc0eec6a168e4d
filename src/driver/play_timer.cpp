#include "driver/play_timer.h"

void PlayTimer::Start(std::chrono::milliseconds interval) {
  Stop();
  std::unique_lock<std::mutex> lock(latch_);
  interval_ = interval;
  running_ = true;
  worker_ = std::thread(&PlayTimer::Run, this);
}

void PlayTimer::Stop() {
  {
    std::unique_lock<std::mutex> lock(latch_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

bool PlayTimer::IsRunning() {
  std::unique_lock<std::mutex> lock(latch_);
  return running_;
}

void PlayTimer::Run() {
  std::unique_lock<std::mutex> lock(latch_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
      break;
    }
    lock.unlock();
    bool keep_running = callback_();
    lock.lock();
    if (!keep_running) {
      running_ = false;
    }
  }
}
