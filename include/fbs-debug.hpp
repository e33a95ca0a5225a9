/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/fbs-debug.hpp
 * @brief Debug-print macro used for all diagnostic output of the service.
 *
 * FBS_DEBUG_PRINT(print_stmt) evaluates the given stream statement when
 * NDEBUG is not defined and compiles to an empty statement otherwise, so
 * release builds of the server and client pay nothing for tracing dropped
 * datagrams, retransmissions or cache replays.
 *
 *  - Debug build:   FBS_DEBUG_PRINT(std::cerr << "x: " << x << "\n");
 *                   -> (std::cerr << "x: " << x << "\n");
 *  - Release build: FBS_DEBUG_PRINT(...) -> nothing, the argument is not
 *                   evaluated.
 *
 * The statement is wrapped in do { } while (false) so the macro behaves as a
 * single statement inside if/else without braces.
 */

#ifndef FBS_DEBUG_HPP_
#define FBS_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define FBS_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
  } while (false)
#else
#define FBS_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#endif // FBS_DEBUG_HPP_
