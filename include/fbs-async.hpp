/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-async.hpp
 * @brief Fbs_Async: a serial executor running submitted tasks in order on a
 *        single background thread.
 *
 * The server owns a small pool of these as its workers. All datagrams of one
 * client land on the same worker, so they are handled one at a time and in
 * arrival order without any lock held across the handling.
 *
 *  - addExecTask() enqueues a task and returns immediately.
 *  - addExecTaskWithWait() also returns a Fbs_Async_Wait whose wait() blocks
 *    until the task has run, rethrowing whatever the task threw.
 *  - waitForEmpty() (inherited) blocks until everything queued so far ran.
 *
 * A std::exception escaping a fire-and-forget task is logged through
 * FBS_DEBUG_PRINT and the executor keeps running.
 */

#ifndef FBS_ASYNC_HPP_
#define FBS_ASYNC_HPP_

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "fbs-pipe.hpp"

#define FBS_ASYNC_CALL_WITH_CAPTURE(block, ...)                                \
  do {                                                                         \
    this->addExecTask([__VA_ARGS__]() mutable -> void { block; });             \
  } while (false)

namespace fbs {

class Fbs_Async : public Fbs_Pipe<std::function<void()>> {
public:
  class Fbs_Async_Wait {
    friend class Fbs_Async;

  public:
    void wait();

  private:
    std::mutex m_mutex{};
    std::condition_variable m_cond_var{};

    bool m_done{};
    std::exception_ptr m_thrown_exception{};
  };

  explicit Fbs_Async(std::string_view name = "");
  virtual ~Fbs_Async() noexcept;

  Fbs_Async(const Fbs_Async &obj) = delete;
  const Fbs_Async &operator=(const Fbs_Async &obj) = delete;
  Fbs_Async(Fbs_Async &&obj) = delete;
  Fbs_Async &operator=(Fbs_Async &&obj) = delete;

  void addExecTask(std::function<void()> fnc);

  auto addExecTaskWithWait(std::function<void()> fnc)
      -> std::shared_ptr<Fbs_Async_Wait>;

private:
  using Fbs_Pipe::read;
  using Fbs_Pipe::readAndProcess;
  using Fbs_Pipe::write;
}; // class Fbs_Async

} // namespace fbs

#endif // FBS_ASYNC_HPP_
