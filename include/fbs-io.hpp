/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-io.hpp
 * @brief Transport-agnostic read/write interface.
 *
 * Fbs_Io<T> is the seam between the service logic and whatever moves its
 * data: a UDP socket, the loss-simulating wrapper around it, or an in-process
 * pipe used as a loopback in tests. The server and the client only ever see
 * an Fbs_Io<Fbs_Datagram> for input and one for output.
 *
 * Semantics:
 *  - read(): blocks until the next item is available and returns it. It
 *    returns std::nullopt when the source is closed or failed for good;
 *    callers treat that as end-of-stream.
 *  - write(T &): copies the item out; the caller keeps ownership.
 *  - write(T &&): may move from the item.
 *
 * Thread-safety is up to the implementation and is documented there.
 */

#ifndef FBS_IO_HPP_
#define FBS_IO_HPP_

#include <optional>

namespace fbs {

template <typename T> class Fbs_Io {
public:
  virtual ~Fbs_Io() noexcept = default;

  /**
   * @brief Read and return the next available item, blocking if needed.
   *
   * @return The next item, or std::nullopt on end-of-stream.
   */
  virtual auto read() -> std::optional<T> = 0;

  virtual void write(T &item) = 0;
  virtual void write(T &&item) = 0;
};

} // namespace fbs

#endif // FBS_IO_HPP_
