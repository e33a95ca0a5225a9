/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-runtime.cpp
 * @brief Implementation of Fbs_Runtime_Manager.
 *
 * - Constructor: installs the default SIGTERM/SIGINT hooks that call
 *   exitMainLoop().
 * - enterMainLoop(): starts the signal-wait thread, which calls sigwait()
 *   and dispatches every signal to its hooks in the asynchronous context,
 *   then blocks until exitMainLoop() is called.
 * - maskSignals(): blocks the handled signals before any threads are
 *   created so that they are delivered only through sigwait().
 */

#include "fbs-runtime.hpp"

#include <pthread.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "fbs-async.hpp"
#include "fbs-debug.hpp"
#include "fbs-proc.hpp"

namespace fbs {

Fbs_Runtime_Manager::Fbs_Runtime_Manager() : Fbs_Async{"runtime-manager"} {
  m_signal_handler_hooks[SIGTERM] = [this]([[maybe_unused]] int signo) {
    this->exitMainLoop();
  };

  m_signal_handler_hooks[SIGINT] = [this]([[maybe_unused]] int signo) {
    this->exitMainLoop();
  };
}

Fbs_Runtime_Manager::~Fbs_Runtime_Manager() noexcept try {
  m_signal_wait_proc.reset();

  this->waitForEmpty();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Fbs_Runtime_Manager::handledSignals() -> sigset_t {
  sigset_t mask{};

  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  sigaddset(&mask, SIGQUIT);
  sigaddset(&mask, SIGHUP);

  return mask;
}

void Fbs_Runtime_Manager::maskSignals() {
  const sigset_t mask = handledSignals();
  sigset_t old_mask{};

  const int err = pthread_sigmask(SIG_BLOCK, &mask, &old_mask);
  if (0 != err) {
    throw std::runtime_error("Error in pthread_sigmask: " +
                             std::system_category().message(err));
  }
}

void Fbs_Runtime_Manager::enterMainLoop() {
  if (m_main_enter_atomic_flag.test_and_set(std::memory_order_acquire)) {
    throw std::runtime_error("Error: enter main loop twice without exit");
  }

  m_main_exit_atomic_flag.clear(std::memory_order_relaxed);

  m_signal_wait_proc = std::make_unique<Fbs_Proc>(
      "runtime-signal-wait", [this]() -> void {
        const sigset_t mask = handledSignals();

        while (true) {
          int signo{};

          const int err = sigwait(&mask, &signo);
          if (err) {
            FBS_DEBUG_PRINT(std::cerr << "Error in sigwait: "
                                      << std::system_category().message(err)
                                      << "\n");

            Fbs_Proc::yield();
            continue;
          }

          this->addExecTask([this, signo]() {
            this->execSignalHandlerHookInternal(signo);
          });
        }
      });

  if (!m_signal_wait_proc->exec()) {
    throw std::runtime_error("Failed to start runtime signal-wait task");
  }

  while (!m_main_exit_atomic_flag.test(std::memory_order_acquire)) {
    m_main_exit_atomic_flag.wait(false, std::memory_order_acquire);
  }

  m_signal_wait_proc.reset();
  m_main_enter_atomic_flag.clear(std::memory_order_release);
}

void Fbs_Runtime_Manager::exitMainLoop() {
  if (!m_main_exit_atomic_flag.test_and_set(std::memory_order_release)) {
    m_main_exit_atomic_flag.notify_all();
  }
}

void Fbs_Runtime_Manager::registerSignalHandlerHook(int signo,
                                                    SignalHandlerHook hook) {
  this->addExecTask([this, signo, hook = std::move(hook)]() mutable {
    m_signal_handler_hooks_external[signo].push_back(std::move(hook));
  });
}

/**
 * Runs in the asynchronous context. External hooks run first, then the
 * default hook of the signal if it has one.
 */
void Fbs_Runtime_Manager::execSignalHandlerHookInternal(int signo) {
  FBS_DEBUG_PRINT(std::cerr << "signal " << signo << " (" << strsignal(signo)
                            << ")\n");

  auto ext_hooks = m_signal_handler_hooks_external.find(signo);
  if (m_signal_handler_hooks_external.end() != ext_hooks) {
    for (auto &fnc : ext_hooks->second) {
      fnc(signo);
    }
  }

  auto hook = m_signal_handler_hooks.find(signo);
  if (m_signal_handler_hooks.end() != hook) {
    hook->second(signo);
  }
}

} // namespace fbs
