/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-socket.hpp
 * @brief UDP socket implementing Fbs_Io<Fbs_Datagram>.
 *
 * Fbs_Socket owns one AF_INET/SOCK_DGRAM descriptor bound to a local
 * address. Each read() returns one whole datagram together with the address
 * it came from; each write() sends one datagram to the address it carries.
 * The server binds its well-known port, a client binds port 0 and lets the
 * kernel pick an ephemeral one (see localAddress()).
 *
 * read() blocks in recvfrom(), which is a pthread cancellation point, so the
 * Fbs_Proc reading the socket can be stopped at any time. OS failures are
 * thrown as std::runtime_error.
 *
 * read() and write() may be called concurrently from different threads;
 * concurrent writers are serialized by the kernel per datagram.
 */

#ifndef FBS_SOCKET_HPP_
#define FBS_SOCKET_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "fbs-io.hpp"

namespace fbs {

/**
 * Largest datagram read() accepts, bigger ones are truncated by the kernel
 * and rejected by the codec.
 */
constexpr size_t kFbsMaxDatagramSize = 65507;

struct Fbs_Address {
  std::string ip4{};
  int port{};

  auto operator==(const Fbs_Address &other) const -> bool = default;

  auto toString() const -> std::string;

  /**
   * @brief Parse "a.b.c.d:port".
   */
  static auto fromString(std::string_view text) -> std::optional<Fbs_Address>;
};

struct Fbs_Address_Hash {
  auto operator()(const Fbs_Address &address) const -> size_t {
    return std::hash<std::string>{}(address.ip4) ^
           (std::hash<int>{}(address.port) << 1);
  }
};

/**
 * One datagram and its remote end: the sender for a datagram read, the
 * destination for a datagram written.
 */
struct Fbs_Datagram {
  Fbs_Address peer{};
  std::string payload{};
};

class Fbs_Socket : public Fbs_Io<Fbs_Datagram> {
public:
  /**
   * @param ip4     Local IPv4 address to bind, empty for INADDR_ANY.
   * @param port_no Local port to bind, 0 for an ephemeral port.
   *
   * @throws std::runtime_error if the socket can not be created or bound.
   */
  explicit Fbs_Socket(std::string_view ip4 = "", int port_no = 0);
  virtual ~Fbs_Socket() noexcept;

  Fbs_Socket(const Fbs_Socket &obj) = delete;
  const Fbs_Socket &operator=(const Fbs_Socket &obj) = delete;
  Fbs_Socket(Fbs_Socket &&obj) = delete;
  Fbs_Socket &operator=(Fbs_Socket &&obj) = delete;

  /**
   * @return The next datagram, or std::nullopt if recvfrom() failed.
   */
  auto read() -> std::optional<Fbs_Datagram> override;

  /**
   * @throws std::runtime_error if the peer address is not a valid IPv4
   *         address or sendto() fails.
   */
  void write(Fbs_Datagram &item) override;
  void write(Fbs_Datagram &&item) override;

  /**
   * @brief The address the socket is bound to, with the port the kernel
   *        picked when the socket was bound to port 0.
   */
  auto localAddress() const -> Fbs_Address;

private:
  int m_fd{-1};
}; // class Fbs_Socket

} // namespace fbs

#endif // FBS_SOCKET_HPP_
