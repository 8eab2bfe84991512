#ifndef NETNAME_FIRST_MATCH_H_
#define NETNAME_FIRST_MATCH_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Single-assignment cell shared by concurrent probes. The first offer()
// stores its value; every later offer is ignored. close() marks that no
// more offers will come, which also releases wait_until().
template <typename T>
class FirstMatch {
 public:
  FirstMatch() : set_(false), closed_(false) {}

  // Returns true if this call stored the value.
  bool offer(const T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (set_.load()) return false;
    value_ = value;
    set_.store(true);
    cond_.notify_all();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cond_.notify_all();
  }

  // Lock free, for polling from probe loops.
  bool is_set() const { return set_.load(); }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  // Blocks until a value is stored, close() is called or |deadline|
  // passes. Returns is_set().
  template <typename Clock, typename Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_until(lock, deadline,
                     [this] { return set_.load() || closed_; });
    return set_.load();
  }

  // Only meaningful once is_set() returned true.
  T value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cond_;
  std::atomic<bool> set_;
  bool closed_;
  T value_;
};

#endif  // NETNAME_FIRST_MATCH_H_
