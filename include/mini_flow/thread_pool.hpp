#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Infrastructure: Thread Pool & Timer Queue
// ==========================================
class ThreadPool {
 public:
  explicit ThreadPool(size_t threads = std::thread::hardware_concurrency())
      : stop_(false) {
    if (threads == 0) threads = 1;
    for (size_t i = 0; i < threads; ++i)
      workers_.emplace_back([this] {
        while (true) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(this->queue_mutex_);
            this->condition_.wait(
                lock, [this] { return this->stop_ || !this->tasks_.empty(); });
            if (this->stop_ && this->tasks_.empty()) {
              return;
            }
            task = std::move(this->tasks_.front());
            this->tasks_.pop();
          }
          task();
        }
      });
  }

  template <class F>
  void Enqueue(F&& f) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      if (stop_) {
        throw std::runtime_error("Enqueue on stopped ThreadPool");
      }

      tasks_.emplace(std::forward<F>(f));
    }
    condition_.notify_one();
  }

  size_t Size() const { return workers_.size(); }

  ~ThreadPool() {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
      worker.join();
    }
  }

 private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_;
};

// One thread that fires callbacks at deadlines. Callbacks run on the timer
// thread with no lock held, so they must be short: hand real work to a pool.
class TimerQueue {
 public:
  using TimerId = uint64_t;
  using Clock = std::chrono::steady_clock;

  TimerQueue() : thread_([this] { Loop(); }) {}

  ~TimerQueue() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

  TimerQueue(const TimerQueue&) = delete;
  TimerQueue& operator=(const TimerQueue&) = delete;

  // Returns 0 once the queue is stopping; the callback is then dropped.
  TimerId Schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
    TimerId id = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stop_) return 0;
      id = ++next_id_;
      auto deadline = Clock::now() + delay;
      timers_.emplace(std::make_pair(deadline, id), std::move(fn));
      deadlines_[id] = deadline;
    }
    cv_.notify_all();
    return id;
  }

  // False if the timer already fired or was never scheduled.
  bool Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) return false;
    timers_.erase(std::make_pair(it->second, id));
    deadlines_.erase(it);
    return true;
  }

  size_t Pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return timers_.size();
  }

 private:
  using Key = std::pair<Clock::time_point, TimerId>;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<Key, std::function<void()>> timers_;
  std::unordered_map<TimerId, Clock::time_point> deadlines_;
  TimerId next_id_ = 0;
  bool stop_ = false;
  std::thread thread_;

  void Loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_) {
      if (timers_.empty()) {
        cv_.wait(lock, [this] { return stop_ || !timers_.empty(); });
        continue;
      }
      auto deadline = timers_.begin()->first.first;
      if (Clock::now() < deadline) {
        cv_.wait_until(lock, deadline);
        continue;
      }
      auto node = timers_.extract(timers_.begin());
      deadlines_.erase(node.key().second);
      lock.unlock();
      node.mapped()();
      lock.lock();
    }
  }
};

}  // namespace miniflow
