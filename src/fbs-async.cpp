/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-async.cpp
 * @brief The source implementation file for fbs-async.
 */

#include "fbs-async.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "fbs-debug.hpp"
#include "fbs-pipe.hpp"
#include "fbs-proc.hpp"

namespace fbs {

void Fbs_Async::Fbs_Async_Wait::wait() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cond_var.wait(lock, [this]() -> bool { return m_done; });

  if (m_thrown_exception) {
    std::rethrow_exception(m_thrown_exception);
  }
}

Fbs_Async::Fbs_Async(std::string_view name)
    : Fbs_Pipe{name, [name = std::string{name}](
                         std::function<void()> &&task) -> void {
                 try {
                   std::move(task)();
                 } catch (const std::exception &e) {
                   FBS_DEBUG_PRINT(std::cerr << "Fbs_Async (" << name
                                             << ") task failed: " << e.what()
                                             << "\n");
                 }

                 Fbs_Proc::yield();
               }} {}

Fbs_Async::~Fbs_Async() noexcept try { this->waitForEmpty(); } catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Fbs_Async::addExecTask(std::function<void()> fnc) {
  this->write(std::move(fnc));
}

auto Fbs_Async::addExecTaskWithWait(std::function<void()> fnc)
    -> std::shared_ptr<Fbs_Async::Fbs_Async_Wait> {
  auto wait_shared_ptr = std::make_shared<Fbs_Async_Wait>();

  this->write([wait_shared_ptr, fnc = std::move(fnc)]() -> void {
    try {
      fnc();
    } catch (const std::exception &) {
      wait_shared_ptr->m_thrown_exception = std::current_exception();
    }

    const std::unique_lock<std::mutex> lock(wait_shared_ptr->m_mutex);
    wait_shared_ptr->m_done = true;
    wait_shared_ptr->m_cond_var.notify_all();
  });

  return wait_shared_ptr;
}

} // namespace fbs
