// bounded_channel.hpp
// Description:
//   Fixed-capacity FIFO shared by any number of producer and consumer threads.
//   Receives wait at most the given timeout and report "empty" as std::nullopt.

#ifndef ROBOMASTER_TELEOP__BOUNDED_CHANNEL_HPP_
#define ROBOMASTER_TELEOP__BOUNDED_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace robomaster_teleop
{

template<typename T>
class BoundedChannel
{
public:
  explicit BoundedChannel(std::size_t capacity)
  : capacity_(capacity)
  {
    if (capacity_ == 0) {
      throw std::invalid_argument("BoundedChannel capacity must be positive");
    }
  }

  BoundedChannel(const BoundedChannel &) = delete;
  BoundedChannel & operator=(const BoundedChannel &) = delete;

  // Waits up to `timeout` for a free slot. Returns false if the item was not queued.
  template<typename Rep, typename Period>
  bool send(T item, const std::chrono::duration<Rep, Period> & timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = not_full_.wait_for(
      lock, timeout, [this] {return closed_ || items_.size() < capacity_;});
    if (!ready || closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool trySend(T item)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_) {
      return false;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Returns the oldest item, or std::nullopt if none arrived within `timeout`.
  // Empty is the normal outcome of a quiet poll, not an error.
  template<typename Rep, typename Period>
  std::optional<T> receive(const std::chrono::duration<Rep, Period> & timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = not_empty_.wait_for(
      lock, timeout, [this] {return closed_ || !items_.empty();});
    if (!ready || items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  // Wakes every waiter. Remaining items can still be received.
  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  std::size_t capacity() const {return capacity_;}

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace robomaster_teleop

#endif  // ROBOMASTER_TELEOP__BOUNDED_CHANNEL_HPP_
