/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-runtime.hpp
 * @brief Fbs_Runtime_Manager: POSIX signal handling and the main loop of the
 *        fbs-server daemon.
 *
 * Signals are not handled asynchronously. maskSignals() blocks SIGINT,
 * SIGTERM, SIGQUIT and SIGHUP in the calling thread; called first thing in
 * main(), before any thread exists, every thread created afterwards inherits
 * the mask. enterMainLoop() then starts a thread that takes the blocked
 * signals with sigwait() and runs the hooks registered for each one in the
 * manager's own asynchronous context, one at a time.
 *
 * SIGINT and SIGTERM by default end the main loop, after any hook registered
 * for them has run.
 */

#ifndef FBS_RUNTIME_HPP_
#define FBS_RUNTIME_HPP_

#include <atomic>
#include <csignal>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include "fbs-async.hpp"
#include "fbs-proc.hpp"

namespace fbs {

class Fbs_Runtime_Manager : private Fbs_Async {
public:
  using SignalHandlerHook = std::function<void(int signo)>;

  Fbs_Runtime_Manager();
  virtual ~Fbs_Runtime_Manager() noexcept;

  Fbs_Runtime_Manager(const Fbs_Runtime_Manager &obj) = delete;
  const Fbs_Runtime_Manager &operator=(const Fbs_Runtime_Manager &obj) = delete;
  Fbs_Runtime_Manager(Fbs_Runtime_Manager &&obj) = delete;
  Fbs_Runtime_Manager &operator=(Fbs_Runtime_Manager &&obj) = delete;

  /**
   * @brief Block the handled signals in the calling thread.
   *
   * @throws std::runtime_error if pthread_sigmask fails.
   */
  static void maskSignals();

  /**
   * @brief Wait for signals and run their hooks until exitMainLoop().
   *
   * @throws std::runtime_error if called again before the loop exited.
   */
  void enterMainLoop();

  void exitMainLoop();

  /**
   * @brief Add @p hook to the hooks run when @p signo is received. SIGKILL
   *        and SIGSTOP can not be handled.
   */
  void registerSignalHandlerHook(int signo, SignalHandlerHook hook);

private:
  void execSignalHandlerHookInternal(int signo);

  static auto handledSignals() -> sigset_t;

  std::unordered_map<int, SignalHandlerHook> m_signal_handler_hooks{};
  std::unordered_map<int, std::vector<SignalHandlerHook>>
      m_signal_handler_hooks_external{};

  std::atomic_flag m_main_enter_atomic_flag{};
  std::atomic_flag m_main_exit_atomic_flag{};

  std::unique_ptr<Fbs_Proc> m_signal_wait_proc{};
}; // class Fbs_Runtime_Manager

} // namespace fbs

#endif // FBS_RUNTIME_HPP_
