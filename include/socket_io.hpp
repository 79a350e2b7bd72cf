#pragma once
/**
 * @file socket_io.hpp
 * @brief Non-blocking TCP socket helpers for the Linux host (POSIX).
 *
 * @details
 * PURPOSE
 * -------
 * The thin syscall layer under TcpControlChannel and TcpDataChannel. Free
 * functions over plain file descriptors, no classes, no threads. Every
 * socket returned is non-blocking; readiness is left to poll(2).
 *
 * - tcp_connect_start / tcp_connect_finish: resolve and begin a connect,
 *   then read SO_ERROR once poll reports the socket writable.
 * - tcp_listen_ephemeral: bind 0.0.0.0 on a kernel-chosen port.
 * - tcp_accept: take one pending connection.
 * - list_ipv4_interfaces: local addresses and netmasks (getifaddrs).
 *
 * Failures return -1/false with a short reason in @p err, e.g.
 * `resolve_failed:printer.local` or `connect_failed:Connection refused`.
 */

#include "zebralink/ipv4.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace zebralink {

int  tcp_connect_start(const std::string& host, uint16_t port, std::string& err);
bool tcp_connect_finish(int fd, std::string& err);

/// Listening socket on an ephemeral port; the port is written to @p port.
int  tcp_listen_ephemeral(uint16_t& port, std::string& err);

/// Accepted descriptor, or -1. @p err stays empty when nothing was pending.
int  tcp_accept(int listen_fd, std::string& err);

bool socket_peer_ipv4(int fd, uint32_t& addr);

std::vector<Ipv4Interface> list_ipv4_interfaces();

void close_socket(int fd);

} // namespace zebralink
