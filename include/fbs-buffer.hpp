/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-buffer.hpp
 * @brief Thread-safe, unbounded FIFO queue.
 *
 * Fbs_Buffer<T> is the queue underneath Fbs_Pipe, and through it underneath
 * every Fbs_Async executor (server workers, timers) and the in-process
 * loopback endpoints used by the tests.
 *
 *  - push() never blocks on consumers.
 *  - pop() blocks until an item is available; popNoWait() returns
 *    std::nullopt instead of blocking.
 *  - pop(count, timeout) returns exactly @p count items when they are
 *    available; with timeout > 0 (microseconds) it returns the 1..count
 *    items present when the timeout expires, and keeps waiting while the
 *    queue is still empty.
 *  - waitForEmpty() blocks until every item pushed so far has been popped.
 *
 * All waits are pthread cancellation points. The mutex is released through
 * FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP if a waiting thread is cancelled.
 * pthread failures are reported as std::runtime_error.
 */

#ifndef FBS_BUFFER_HPP_
#define FBS_BUFFER_HPP_

#include <pthread.h>

#include <cassert>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <deque>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "fbs-proc.hpp"

namespace fbs {

template <typename T = std::string> class Fbs_Buffer {
public:
  Fbs_Buffer();
  virtual ~Fbs_Buffer() noexcept;

  Fbs_Buffer(const Fbs_Buffer<T> &obj) = delete;
  const Fbs_Buffer<T> &operator=(const Fbs_Buffer<T> &obj) = delete;
  Fbs_Buffer(Fbs_Buffer<T> &&obj) = delete;
  Fbs_Buffer<T> &operator=(Fbs_Buffer<T> &&obj) = delete;

  /**
   * @brief Remove and return the front item, blocking while empty.
   */
  virtual auto pop() -> T;

  /**
   * @brief Remove up to @p count items.
   *
   * @param count   Number of items wanted, must be > 0.
   * @param timeout Microseconds to wait for the full count, 0 is forever.
   */
  virtual auto pop(size_t count, long timeout = 0) -> std::vector<T>;

  /**
   * @brief Remove and return the front item, or std::nullopt if empty.
   */
  virtual auto popNoWait() -> std::optional<T>;

  virtual void push(T &&item);

  /**
   * @brief Push an lvalue, moving from it when @p move is true.
   */
  virtual void push(T &item, bool move = true);

  /**
   * @brief Block until the queue is empty.
   *
   * @return Total number of items that have passed through the queue.
   */
  virtual auto waitForEmpty() -> size_t;

protected:
  virtual auto popOptional(bool wait) -> std::optional<T>;

private:
  void lock();
  void unlock();
  void signal(pthread_cond_t *cond);

  std::deque<T> m_queue{};
  pthread_mutex_t m_mutex{};
  pthread_cond_t m_not_empty_cond{};
  pthread_cond_t m_empty_cond{};
  size_t m_push_count{};
  size_t m_pop_count{};
}; // class Fbs_Buffer

template <typename T> Fbs_Buffer<T>::Fbs_Buffer() {
  int err = pthread_mutex_init(&m_mutex, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_not_empty_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }

  err = pthread_cond_init(&m_empty_cond, nullptr);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> Fbs_Buffer<T>::~Fbs_Buffer() noexcept try {
  pthread_cond_broadcast(&m_not_empty_cond);
  pthread_cond_broadcast(&m_empty_cond);

  pthread_cond_destroy(&m_empty_cond);
  pthread_cond_destroy(&m_not_empty_cond);
  pthread_mutex_destroy(&m_mutex);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> void Fbs_Buffer<T>::lock() {
  const int err = pthread_mutex_lock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> void Fbs_Buffer<T>::unlock() {
  const int err = pthread_mutex_unlock(&m_mutex);
  if (err) {
    throw std::runtime_error(strerror(err));
  }
}

template <typename T> void Fbs_Buffer<T>::signal(pthread_cond_t *cond) {
  const int err = pthread_cond_broadcast(cond);
  if (err) {
    pthread_mutex_unlock(&m_mutex);

    throw std::runtime_error(strerror(err));
  }
}

template <typename T> auto Fbs_Buffer<T>::pop() -> T {
  return *popOptional(true);
}

template <typename T> auto Fbs_Buffer<T>::popNoWait() -> std::optional<T> {
  return popOptional(false);
}

template <typename T> void Fbs_Buffer<T>::push(T &&item) {
  T moved_item = std::move_if_noexcept(item);

  push(moved_item, true);
}

template <typename T> void Fbs_Buffer<T>::push(T &item, bool move) {
  lock();

  FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  if (move) {
    m_queue.push_back(std::move_if_noexcept(item));
  } else {
    m_queue.push_back(item);
  }

  ++m_push_count;

  signal(&m_not_empty_cond);

  FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();
}

template <typename T> auto Fbs_Buffer<T>::waitForEmpty() -> size_t {
  size_t inbound_count{};

  lock();

  FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (!m_queue.empty()) {
    const int err = pthread_cond_wait(&m_empty_cond, &m_mutex);
    if (err) {
      throw std::runtime_error(strerror(err));
    }

    pthread_testcancel();
  }

  assert(m_pop_count == m_push_count);
  inbound_count = m_pop_count;

  FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return inbound_count;
}

template <typename T>
auto Fbs_Buffer<T>::pop(size_t count, long timeout) -> std::vector<T> {
  struct timespec deadline{};
  std::vector<T> ret{};

  assert(count > 0);

  lock();

  FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (m_queue.size() < count) {
    int err{};

    if (timeout > 0) {
      if (0 == deadline.tv_sec) {
        clock_gettime(CLOCK_REALTIME, &deadline);

        deadline.tv_sec += (timeout / 1000000L);
        deadline.tv_nsec += (timeout % 1000000L) * 1000L;
        if (deadline.tv_nsec >= 1000000000L) {
          deadline.tv_sec += 1;
          deadline.tv_nsec -= 1000000000L;
        }
      }

      err = pthread_cond_timedwait(&m_not_empty_cond, &m_mutex, &deadline);
    } else {
      err = pthread_cond_wait(&m_not_empty_cond, &m_mutex);
    }

    if (ETIMEDOUT == err) {
      if (!m_queue.empty()) {
        break;
      }

      // still empty: re-arm the deadline and keep waiting
      deadline = {};
    } else if (err) {
      throw std::runtime_error(strerror(err));
    }

    pthread_testcancel();
  }

  while (count > 0 && !m_queue.empty()) {
    ret.push_back(std::move_if_noexcept(m_queue.front()));
    m_queue.pop_front();
    ++m_pop_count;

    --count;
  }

  if (m_queue.empty()) {
    signal(&m_empty_cond);
  }

  FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return ret;
}

template <typename T>
auto Fbs_Buffer<T>::popOptional(bool wait) -> std::optional<T> {
  std::optional<T> val{};

  lock();

  FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  pthread_testcancel();

  while (wait && m_queue.empty()) {
    const int err = pthread_cond_wait(&m_not_empty_cond, &m_mutex);
    if (err) {
      throw std::runtime_error(strerror(err));
    }

    pthread_testcancel();
  }

  if (!m_queue.empty()) {
    val = std::move_if_noexcept(m_queue.front());
    m_queue.pop_front();
    ++m_pop_count;

    if (m_queue.empty()) {
      signal(&m_empty_cond);
    }
  }

  FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return val;
} // method popOptional()

} // namespace fbs

#endif // FBS_BUFFER_HPP_
