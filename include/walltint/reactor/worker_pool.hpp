#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace walltint::reactor {

// Fixed-size pool for the CPU-bound sampling/synthesis work. Owned by the daemon; the destructor
// drains queued jobs and joins.
class WorkerPool {
 public:
  explicit WorkerPool(int threads) {
    int n = threads > 0 ? threads : static_cast<int>(std::thread::hardware_concurrency());
    if (n <= 0) n = 1;
    threads_.reserve(n);
    for (int i = 0; i < n; ++i) threads_.emplace_back([this] { worker(); });
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  ~WorkerPool() {
    {
      std::lock_guard<std::mutex> lk(m_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_)
      if (t.joinable()) t.join();
  }

  std::size_t size() const noexcept { return threads_.size(); }

  // Fire-and-forget; returns false once the pool is shutting down.
  bool post(std::function<void()> job) {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (stop_) return false;
      q_.emplace(std::move(job));
    }
    cv_.notify_one();
    return true;
  }

 private:
  void worker() {
    for (;;) {
      std::function<void()> job;
      {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
        if (stop_ && q_.empty()) return;
        job = std::move(q_.front());
        q_.pop();
      }
      job();
    }
  }

  std::mutex m_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> q_;
  std::vector<std::thread> threads_;
  bool stop_ = false;
};

}  // namespace walltint::reactor
