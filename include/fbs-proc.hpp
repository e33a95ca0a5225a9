/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-proc.hpp
 * @brief RAII wrapper around a pthread running a single task.
 *
 * Fbs_Proc runs a std::function<void()> in its own pthread. Every long-lived
 * thread of the service is one of these: the server's datagram input loop,
 * the client's receive loop, the executors behind Fbs_Async and the periodic
 * Fbs_Timer.
 *
 * Stopping is done through deferred pthread cancellation. recvfrom(),
 * pthread_cond_wait() and Fbs_Proc::yield() are cancellation points, so a
 * task blocked on a socket or on an empty queue can be stopped from another
 * thread; a task spinning without reaching one of them can not. The
 * destructor cancels and joins a running thread.
 *
 * FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP / FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP
 * bracket a region holding a pthread mutex so that the mutex is released if
 * the thread is cancelled inside the region.
 */

#ifndef FBS_PROC_HPP_
#define FBS_PROC_HPP_

#include <pthread.h>

#include <functional>
#include <string>
#include <string_view>

#define FBS_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(mutex)                            \
  pthread_cleanup_push(&fbs::cleanupFuncToUnlockPthreadMutex, (mutex))

#define FBS_PROC_EXIT_PTHREAD_MUTEX_CLEANUP(...) pthread_cleanup_pop(0)

namespace fbs {

/**
 * Cleanup handler for pthread_cleanup_push: unlocks the pthread_mutex_t
 * pointed to by @p arg.
 */
void cleanupFuncToUnlockPthreadMutex(void *arg);

class Fbs_Proc {
  using Task = std::function<void()>;

  enum class State { kInvalid, kNew, kReady, kRunning };

public:
  /**
   * @param name Name used in diagnostics.
   * @param fnc  Task run by exec(); may also be supplied to exec() later.
   */
  explicit Fbs_Proc(std::string_view name, const Fbs_Proc::Task &fnc = {});
  virtual ~Fbs_Proc() noexcept;

  Fbs_Proc(const Fbs_Proc &obj) = delete;
  const Fbs_Proc &operator=(const Fbs_Proc &obj) = delete;
  Fbs_Proc(Fbs_Proc &&obj) = delete;
  Fbs_Proc &operator=(Fbs_Proc &&obj) = delete;

  /**
   * @brief Start a thread running @p fnc, or the task set earlier.
   *
   * @return true if the thread was created.
   * @throws std::runtime_error if no task is set or a thread is running.
   */
  auto exec(const Fbs_Proc::Task &fnc = {}) -> bool;

  /**
   * @brief Join the running thread.
   *
   * @throws std::runtime_error if no thread is running or the join fails.
   */
  auto wait() -> bool;

  auto getName() const -> const std::string &;

  /**
   * @brief Cancellation point followed by sched_yield().
   */
  static void yield();

  static void testcancel();

protected:
  auto getState() const -> Fbs_Proc::State;
  auto setState(Fbs_Proc::State state) -> Fbs_Proc::State;
  void setTask(Fbs_Proc::Task fnc);

  auto runExec() -> bool;
  auto stopExec() -> bool;

private:
  static auto runFnInThreadHelper(void *context) -> void *;

  const std::string m_name{};

  Fbs_Proc::Task m_fnc{};
  Fbs_Proc::State m_state{};
  pthread_t m_th{};
}; // class Fbs_Proc

} // namespace fbs

#endif // FBS_PROC_HPP_
