#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace dupscan {

// Multi-producer / multi-consumer queue with an explicit close signal.
// A capacity of 0 means unbounded. Items pushed before close() are still
// delivered; pop() returns nullopt only once the channel is closed and empty.
template <typename T>
class Channel {
 public:
  explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  bool push(T item) {
    std::unique_lock lock(mu_);
    cv_not_full_.wait(lock, [this]() { return closed_ || capacity_ == 0 || queue_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(item));
    cv_not_empty_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock lock(mu_);
    cv_not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    cv_not_full_.notify_one();
    return item;
  }

  void close() {
    {
      std::scoped_lock lock(mu_);
      closed_ = true;
    }
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
  }

  // Closes and discards anything still queued.
  void abort() {
    {
      std::scoped_lock lock(mu_);
      closed_ = true;
      queue_.clear();
    }
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
  }

  bool closed() const {
    std::scoped_lock lock(mu_);
    return closed_;
  }

  size_t size() const {
    std::scoped_lock lock(mu_);
    return queue_.size();
  }

 private:
  size_t capacity_{0};

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace dupscan
