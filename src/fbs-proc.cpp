/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-proc.cpp
 * @brief Implementation of Fbs_Proc, the pthread wrapper.
 */

#include "fbs-proc.hpp"

#include <pthread.h>
#include <sched.h>

#include <cerrno>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace fbs {

void cleanupFuncToUnlockPthreadMutex(void *arg) {
  auto *mutex = static_cast<pthread_mutex_t *>(arg);

  pthread_mutex_unlock(mutex);
}

Fbs_Proc::Fbs_Proc(std::string_view name, const Fbs_Proc::Task &fnc)
    : m_name{name} {
  setState(State::kNew);

  if (fnc) {
    setTask(fnc);
  }
}

Fbs_Proc::~Fbs_Proc() noexcept try {
  if (getState() == State::kRunning) {
    stopExec();
  }

  setState(State::kInvalid);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Fbs_Proc::exec(const Fbs_Proc::Task &fnc) -> bool {
  if (fnc) {
    setTask(fnc);
  }

  return runExec();
}

auto Fbs_Proc::getName() const -> const std::string & { return m_name; }

auto Fbs_Proc::getState() const -> Fbs_Proc::State { return m_state; }

auto Fbs_Proc::setState(State state) -> Fbs_Proc::State {
  const State old_state = m_state;

  m_state = state;

  return old_state;
}

void Fbs_Proc::setTask(Fbs_Proc::Task fnc) {
  if (getState() == State::kRunning) {
    throw std::runtime_error("Fbs_Proc (" + m_name +
                             ") can not change task while running");
  }

  m_fnc = std::move(fnc);
  setState(State::kReady);
}

auto Fbs_Proc::wait() -> bool {
  void *ret{};

  if (getState() != State::kRunning) {
    throw std::runtime_error("No task is exec in Fbs_Proc (" + m_name + ")");
  }

  const int err = pthread_join(m_th, &ret);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  setState(State::kReady);

  return true;
}

void Fbs_Proc::testcancel() { pthread_testcancel(); }

void Fbs_Proc::yield() {
  Fbs_Proc::testcancel();

  sched_yield();
}

auto Fbs_Proc::stopExec() -> bool {
  if (getState() != State::kRunning) {
    return true;
  }

  const int err = pthread_cancel(m_th);
  if (0 != err && ESRCH != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return wait();
}

auto Fbs_Proc::runExec() -> bool {
  if (getState() != State::kReady) {
    throw std::runtime_error("No task is assigned to the Fbs_Proc (" + m_name +
                             ")");
  }

  const State old_state = setState(State::kRunning);
  const int err =
      pthread_create(&m_th, nullptr, &(Fbs_Proc::runFnInThreadHelper), this);
  if (0 != err) {
    setState(old_state);

    return false;
  }

  return true;
}

auto Fbs_Proc::runFnInThreadHelper(void *context) -> void * {
  int old_state{};

  // deferred cancellation: the thread only stops at cancellation points
  pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &old_state);
  pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &old_state);

  auto *proc = static_cast<Fbs_Proc *>(context);
  proc->m_fnc();

  return nullptr;
}

} // namespace fbs
