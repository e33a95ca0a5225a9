/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-pipe.hpp
 * @brief Fbs_Pipe: FIFO with non-blocking writers and optional background
 *        consumer.
 *
 * Fbs_Pipe<T> combines Fbs_Buffer<T> (storage), Fbs_Io<T> (so it can stand
 * in for a socket wherever an endpoint is expected) and Fbs_Proc (so it can
 * drain itself on a background thread).
 *
 *  - Constructed with a task, the pipe starts a thread that calls the task
 *    for every item written, in write order. Fbs_Async is built this way.
 *  - Constructed without a task, the pipe is a plain in-process endpoint:
 *    writers enqueue and read() blocks for the next item. The tests use
 *    pipes of Fbs_Datagram as loopback input/output of the server and the
 *    client.
 *
 * waitForEmpty() returns once every item written before the call has been
 * popped and fully processed by the task.
 */

#ifndef FBS_PIPE_HPP_
#define FBS_PIPE_HPP_

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "fbs-buffer.hpp"
#include "fbs-io.hpp"
#include "fbs-proc.hpp"

namespace fbs {

template <typename T>
class Fbs_Pipe : public Fbs_Buffer<T>, public Fbs_Io<T>, public Fbs_Proc {
  using Task = std::function<void(T &&)>;

public:
  explicit Fbs_Pipe(std::string_view name, Fbs_Pipe::Task fn = {},
                    size_t count = 1, long timeout = 0);

  virtual ~Fbs_Pipe() noexcept;

  Fbs_Pipe(const Fbs_Pipe<T> &obj) = delete;
  const Fbs_Pipe<T> &operator=(const Fbs_Pipe<T> &obj) = delete;
  Fbs_Pipe(Fbs_Pipe<T> &&obj) = delete;
  Fbs_Pipe<T> &operator=(Fbs_Pipe<T> &&obj) = delete;

  auto read() -> std::optional<T> override;

  /**
   * @brief Read up to @p count items, see Fbs_Buffer::pop(count, timeout).
   */
  auto read(size_t count, long timeout = 0) -> std::vector<T>;

  /**
   * @brief Pop the next item(s) and run @p fn on each, then wake
   *        waitForEmpty() callers.
   */
  void readAndProcess(Fbs_Pipe::Task fn, size_t count = 1, long timeout = 0);

  void write(T &item) override;
  void write(T &&item) override;

  auto waitForEmpty() -> size_t override;

  using Fbs_Buffer<T>::popNoWait;

private:
  using Fbs_Buffer<T>::pop;
  using Fbs_Buffer<T>::push;

  std::mutex m_mutex{};
  std::condition_variable m_empty_cond{};
  size_t m_count{};
}; // class Fbs_Pipe

template <typename T>
Fbs_Pipe<T>::Fbs_Pipe(std::string_view name, Fbs_Pipe::Task fn, size_t count,
                      long timeout)
    : Fbs_Proc{name} {
  if (fn) {
    exec([this, fn, count, timeout]() {
      while (true) {
        readAndProcess(fn, count, timeout);
      }
    });
  }
}

template <typename T> Fbs_Pipe<T>::~Fbs_Pipe() noexcept try {
  Fbs_Proc::stopExec();

  m_empty_cond.notify_all();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T> auto Fbs_Pipe<T>::read() -> std::optional<T> {
  std::optional<T> data{};

  readAndProcess([&data](T &&item) { data = std::move(item); });

  return data;
}

template <typename T>
auto Fbs_Pipe<T>::read(size_t count, long timeout) -> std::vector<T> {
  std::vector<T> items{};

  readAndProcess([&items](T &&item) { items.push_back(std::move(item)); },
                 count, timeout);

  return items;
}

template <typename T>
void Fbs_Pipe<T>::readAndProcess(Fbs_Pipe::Task fn, size_t count,
                                 long timeout) {
  auto items = this->pop(count, timeout);

  pthread_testcancel();

  std::unique_lock lock{m_mutex};

  for (auto &item : items) {
    fn(std::move_if_noexcept(item));
    ++m_count;
  }

  lock.unlock();

  m_empty_cond.notify_all();

  pthread_testcancel();
}

template <typename T> void Fbs_Pipe<T>::write(T &item) {
  Fbs_Buffer<T>::push(item, false);
}

template <typename T> void Fbs_Pipe<T>::write(T &&item) {
  Fbs_Buffer<T>::push(item, true);
}

template <typename T> auto Fbs_Pipe<T>::waitForEmpty() -> size_t {
  const size_t inbound_count = Fbs_Buffer<T>::waitForEmpty();

  std::unique_lock lock{m_mutex};

  pthread_testcancel();

  m_empty_cond.wait(lock,
                    [this, inbound_count] { return m_count >= inbound_count; });

  lock.unlock();

  pthread_testcancel();

  return inbound_count;
}

} // namespace fbs

#endif // FBS_PIPE_HPP_
