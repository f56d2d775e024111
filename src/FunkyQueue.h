#ifndef QRFOUNTAIN_FUNKYQUEUE_H
#define QRFOUNTAIN_FUNKYQUEUE_H

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

/**
 * Bounded thread-safe queue for one (or more) producer thread(s) that must
 * never block (e.g. frame capture / QR decode) and one or more consumer
 * threads. When the queue is full, an element is dropped instead - lost
 * elements are fine for fountain coded data.
 */
template <class T>
class FunkyQueue {
 public:
  enum class DropPolicy {
    // keep the queued elements, discard the new one
    DROP_NEWEST,
    // discard the oldest queued element to make space for the new one
    DROP_OLDEST,
  };
  explicit FunkyQueue(int capacity) : m_capacity(capacity) {
    assert(capacity >= 1);
  };
  // Enqueues a new element. Return true on success, false otherwise
  bool try_enqueue(T element) {
    std::unique_lock<std::mutex> lk(mtx);
    if (queue.size() >= m_capacity) {
      m_n_dropped++;
      return false;
    }
    queue.push_back(std::move(element));
    lk.unlock();
    cv.notify_one();
    return true;
  }
  // Always enqueues the given element. If the queue is full, the oldest
  // element is removed first. Returns the n of removed elements (0 or 1)
  int enqueue_or_drop_oldest(T element) {
    std::unique_lock<std::mutex> lk(mtx);
    int count_removed = 0;
    if (queue.size() >= m_capacity) {
      queue.pop_front();
      m_n_dropped++;
      count_removed = 1;
    }
    queue.push_back(std::move(element));
    lk.unlock();
    cv.notify_one();
    return count_removed;
  }
  // Returns true if the element was enqueued (DROP_OLDEST always enqueues)
  bool enqueue(T element, DropPolicy policy) {
    if (policy == DropPolicy::DROP_OLDEST) {
      enqueue_or_drop_oldest(std::move(element));
      return true;
    }
    return try_enqueue(std::move(element));
  }
  // Wait up to timeout until element is available.
  template <typename Rep, typename Period>
  std::optional<T> wait_dequeue_timed(
      std::chrono::duration<Rep, Period> const& timeout) {
    std::unique_lock<std::mutex> ul(mtx);
    const auto res =
        cv.wait_for(ul, timeout, [this]() { return !queue.empty(); });
    if (!res) {
      // Timeout
      return std::nullopt;
    }
    assert(!queue.empty());
    auto tmp = std::move(queue.front());
    queue.pop_front();
    return tmp;
  }
  // Returns the n of removed elements
  int clear() {
    std::unique_lock<std::mutex> ul(mtx);
    const int ret = static_cast<int>(queue.size());
    queue.clear();
    return ret;
  }
  int get_current_size() {
    std::unique_lock<std::mutex> ul(mtx);
    return static_cast<int>(queue.size());
  }
  // n of elements dropped because the queue was full
  uint64_t get_n_dropped() {
    std::unique_lock<std::mutex> ul(mtx);
    return m_n_dropped;
  }

 private:
  const std::size_t m_capacity;
  std::deque<T> queue;
  uint64_t m_n_dropped = 0;
  std::mutex mtx;
  std::condition_variable cv;
};

#endif  // QRFOUNTAIN_FUNKYQUEUE_H
