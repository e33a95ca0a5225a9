/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-timer.hpp
 * @brief Recurring timer running a callback every fixed interval.
 *
 * Fbs_Timer<T> (T a std::chrono::duration) runs its callback on its own
 * Fbs_Proc thread, no earlier than every @c reltime. The server uses one to
 * purge expired reply-cache entries and monitor subscriptions.
 *
 * A std::exception thrown by the callback is logged and the timer keeps
 * going. stop() and the destructor cancel the thread; the sleep between two
 * runs is a cancellation point.
 */

#ifndef FBS_TIMER_HPP_
#define FBS_TIMER_HPP_

#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <utility>

#include "fbs-debug.hpp"
#include "fbs-proc.hpp"

namespace fbs {

template <typename T> class Fbs_Timer : public Fbs_Proc {
public:
  Fbs_Timer(const T &reltime, std::function<void()> fn);
  virtual ~Fbs_Timer() noexcept;

  Fbs_Timer(const Fbs_Timer &obj) = delete;
  const Fbs_Timer &operator=(const Fbs_Timer &obj) = delete;
  Fbs_Timer(Fbs_Timer &&obj) = delete;
  Fbs_Timer &operator=(Fbs_Timer &&obj) = delete;

  /**
   * @brief Restart the timer with a new interval, and a new callback if
   *        @p fn is set.
   */
  void start(const T &reltime, std::function<void()> fn = {});

  void stop();

private:
  std::function<void()> m_fn{};
  T m_reltime{};
}; // class Fbs_Timer

template <typename T>
Fbs_Timer<T>::Fbs_Timer(const T &reltime, std::function<void()> fn)
    : Fbs_Proc{"timer"}, m_fn{std::move(fn)}, m_reltime{reltime} {
  this->start(m_reltime);
}

template <typename T> Fbs_Timer<T>::~Fbs_Timer() noexcept try {
  this->stop();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

template <typename T>
void Fbs_Timer<T>::start(const T &reltime, std::function<void()> fn) {
  this->stop();

  m_reltime = reltime;
  if (fn) {
    m_fn = std::move(fn);
  }

  this->exec([this]() {
    while (true) {
      std::this_thread::sleep_for(m_reltime);
      Fbs_Proc::yield();

      try {
        if (m_fn) {
          m_fn();
        }
      } catch (const std::exception &e) {
        FBS_DEBUG_PRINT(std::cerr << "timer callback failed: " << e.what()
                                  << "\n");
      }
    }
  });
}

template <typename T> void Fbs_Timer<T>::stop() { this->stopExec(); }

} // namespace fbs

#endif // FBS_TIMER_HPP_
