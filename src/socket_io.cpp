// ============================================================================
// socket_io.cpp - implementation for socket_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "socket_io.hpp"

#include <arpa/inet.h>     // ntohl, ntohs
#include <cerrno>
#include <cstring>         // strerror
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <ifaddrs.h>       // getifaddrs
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>        // ::close

namespace zebralink {

// ---------------------------------------------------------------------------
// set_nonblocking()
// Internal helper; every descriptor handed out goes through it.
// ---------------------------------------------------------------------------
static bool set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

static std::string errno_text() { return std::strerror(errno); }

// ---------------------------------------------------------------------------
// tcp_connect_start()
// -------------------
// Resolve @p host (IPv4 only; PORT cannot express IPv6) and start a
// non-blocking connect. EINPROGRESS is the normal result; the caller polls
// for POLLOUT and then calls tcp_connect_finish().
// ---------------------------------------------------------------------------
int tcp_connect_start(const std::string& host, uint16_t port, std::string& err) {
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    err = "resolve_failed:" + host;
    return -1;
  }

  const int fd = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (fd < 0) {
    err = "socket_failed:" + errno_text();
    ::freeaddrinfo(res);
    return -1;
  }
  if (!set_nonblocking(fd)) {
    err = "socket_failed:" + errno_text();
    ::close(fd);
    ::freeaddrinfo(res);
    return -1;
  }

  const int cr = ::connect(fd, res->ai_addr, res->ai_addrlen);
  ::freeaddrinfo(res);
  if (cr != 0 && errno != EINPROGRESS) {
    err = "connect_failed:" + errno_text();
    ::close(fd);
    return -1;
  }
  return fd;
}

bool tcp_connect_finish(int fd, std::string& err) {
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    err = "connect_failed:" + errno_text();
    return false;
  }
  if (so_error != 0) {
    err = std::string("connect_failed:") + std::strerror(so_error);
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// tcp_listen_ephemeral()
// ----------------------
// One pending connection is all an active-mode upload needs, so the backlog
// is 1.
// ---------------------------------------------------------------------------
int tcp_listen_ephemeral(uint16_t& port, std::string& err) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    err = "socket_failed:" + errno_text();
    return -1;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd, 1) != 0 || !set_nonblocking(fd)) {
    err = "listen_failed:" + errno_text();
    ::close(fd);
    return -1;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    err = "listen_failed:" + errno_text();
    ::close(fd);
    return -1;
  }
  port = ntohs(addr.sin_port);
  return fd;
}

int tcp_accept(int listen_fd, std::string& err) {
  err.clear();
  const int fd = ::accept(listen_fd, nullptr, nullptr);
  if (fd < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
      err = "accept_failed:" + errno_text();
    return -1;
  }
  if (!set_nonblocking(fd)) {
    err = "accept_failed:" + errno_text();
    ::close(fd);
    return -1;
  }
  return fd;
}

bool socket_peer_ipv4(int fd, uint32_t& addr) {
  if (fd < 0) return false;
  sockaddr_in peer{};
  socklen_t len = sizeof(peer);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &len) != 0) return false;
  if (peer.sin_family != AF_INET) return false;
  addr = ntohl(peer.sin_addr.s_addr);
  return true;
}

// ---------------------------------------------------------------------------
// list_ipv4_interfaces()
// ----------------------
// getifaddrs() allocates; always freeifaddrs().
// ---------------------------------------------------------------------------
std::vector<Ipv4Interface> list_ipv4_interfaces() {
  std::vector<Ipv4Interface> out;
  ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) return out;

  for (ifaddrs* it = list; it; it = it->ifa_next) {
    if (!it->ifa_addr || !it->ifa_netmask) continue;
    if (it->ifa_addr->sa_family != AF_INET) continue;
    Ipv4Interface iface;
    iface.name = it->ifa_name ? it->ifa_name : "";
    iface.address = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
    iface.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(it->ifa_netmask)->sin_addr.s_addr);
    out.push_back(iface);
  }
  ::freeifaddrs(list);
  return out;
}

void close_socket(int fd) {
  if (fd >= 0) ::close(fd);
}

} // namespace zebralink
