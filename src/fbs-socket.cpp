/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-socket.cpp
 * @brief Implementation of Fbs_Socket, a UDP (SOCK_DGRAM) socket that
 *        implements the Fbs_Io<Fbs_Datagram> interface.
 *
 * The constructor creates an AF_INET/SOCK_DGRAM socket and binds it to the
 * supplied address and port, port 0 leaving the choice to the kernel.
 *
 * read() calls recvfrom() into a buffer large enough for any UDP payload and
 * records the sender. write() converts the datagram's peer address and uses
 * sendto().
 */

#include "fbs-socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fbs {

namespace {

auto toSockaddr(const Fbs_Address &address) -> struct sockaddr_in {
  struct sockaddr_in sockaddr{};

  memset(&sockaddr, 0, sizeof(sockaddr));

  sockaddr.sin_family = AF_INET;
  sockaddr.sin_port = htons(static_cast<uint16_t>(address.port));
  if (address.ip4.empty()) {
    sockaddr.sin_addr.s_addr = INADDR_ANY;
  } else if (inet_pton(AF_INET, address.ip4.c_str(), &sockaddr.sin_addr) !=
             1) {
    throw std::runtime_error("Invalid IPv4 address: " + address.ip4);
  }

  return sockaddr;
}

auto fromSockaddr(const struct sockaddr_in &sockaddr) -> Fbs_Address {
  char buf[INET_ADDRSTRLEN]{};

  inet_ntop(AF_INET, &sockaddr.sin_addr, buf, sizeof(buf));

  return Fbs_Address{buf, ntohs(sockaddr.sin_port)};
}

} // namespace

auto Fbs_Address::toString() const -> std::string {
  return (ip4.empty() ? std::string{"0.0.0.0"} : ip4) + ":" +
         std::to_string(port);
}

auto Fbs_Address::fromString(std::string_view text)
    -> std::optional<Fbs_Address> {
  struct in_addr addr{};
  int port{};

  const auto colon = text.rfind(':');
  if (colon == std::string_view::npos) {
    return {};
  }

  const std::string ip4{text.substr(0, colon)};
  if (inet_pton(AF_INET, ip4.c_str(), &addr) != 1) {
    return {};
  }

  const auto port_text = text.substr(colon + 1);
  const auto [ptr, ec] = std::from_chars(
      port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
      port <= 0 || port > 65535) {
    return {};
  }

  return Fbs_Address{ip4, port};
}

Fbs_Socket::Fbs_Socket(std::string_view ip4, int port_no) {
  const auto sockaddr = toSockaddr(Fbs_Address{std::string{ip4}, port_no});

  m_fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (m_fd < 0) {
    throw std::runtime_error("Error creating socket: " +
                             std::system_category().message(errno));
  }

  if (bind(m_fd,
           reinterpret_cast<const struct sockaddr *>(
               &sockaddr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
           sizeof(sockaddr)) < 0) {
    const int err = errno;

    close(m_fd);
    m_fd = -1;

    throw std::runtime_error("Error in bind(" + std::to_string(port_no) +
                             ") : " + std::system_category().message(err));
  }
}

Fbs_Socket::~Fbs_Socket() noexcept {
  if (-1 != m_fd) {
    close(m_fd);
  }
}

auto Fbs_Socket::read() -> std::optional<Fbs_Datagram> {
  std::vector<char> buf(kFbsMaxDatagramSize);
  struct sockaddr_in peer{};
  socklen_t peer_len = sizeof(peer);

  const ssize_t n_read = recvfrom(
      m_fd, buf.data(), buf.size(), 0,
      reinterpret_cast<struct sockaddr *>(
          &peer), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      &peer_len);
  if (n_read < 0) {
    return {};
  }

  return Fbs_Datagram{fromSockaddr(peer),
                      std::string(buf.data(), static_cast<size_t>(n_read))};
}

void Fbs_Socket::write(Fbs_Datagram &item) {
  const auto sockaddr = toSockaddr(item.peer);

  const ssize_t n_write = sendto(
      m_fd, item.payload.data(), item.payload.size(), 0,
      reinterpret_cast<const struct sockaddr *>(
          &sockaddr), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
      sizeof(sockaddr));
  if (n_write < 0 || static_cast<size_t>(n_write) != item.payload.size()) {
    throw std::runtime_error("Error in sendto(" + item.peer.toString() +
                             "): " + std::system_category().message(errno));
  }
}

void Fbs_Socket::write(Fbs_Datagram &&item) {
  Fbs_Datagram moved_item = std::move(item);

  write(moved_item);
}

auto Fbs_Socket::localAddress() const -> Fbs_Address {
  struct sockaddr_in local{};
  socklen_t local_len = sizeof(local);

  if (getsockname(
          m_fd,
          reinterpret_cast<struct sockaddr *>(
              &local), // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          &local_len) < 0) {
    throw std::runtime_error("Error in getsockname: " +
                             std::system_category().message(errno));
  }

  return fromSockaddr(local);
}

} // namespace fbs
