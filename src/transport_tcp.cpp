// ============================================================================
// transport_tcp.cpp - implementation for transport_tcp.hpp
// ============================================================================

#include "zebralink/transport/transport_tcp.hpp"
#include "socket_io.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>

namespace zebralink::transport {

static std::string errno_reason(const char* prefix) {
  return std::string(prefix) + std::strerror(errno);
}

// ---------------------------------------------------------------------------
// TcpControlChannel
// ---------------------------------------------------------------------------

bool TcpControlChannel::open(const std::string& host, uint16_t port, std::string& err) {
  close();
  fd_ = tcp_connect_start(host, port, err);
  if (fd_ < 0) return false;
  connecting_ = true;
  return true;
}

// Queued only; the poll loop flushes on POLLOUT.
TxResult TcpControlChannel::send(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || !data) return TxResult::Error;
  out_.insert(out_.end(), data, data + len);
  return TxResult::Ok;
}

bool TcpControlChannel::peer_ipv4(uint32_t& addr) const {
  if (connecting_) return false;
  return socket_peer_ipv4(fd_, addr);
}

void TcpControlChannel::close() {
  close_socket(fd_);
  fd_ = -1;
  connecting_ = false;
  out_.clear();
}

void TcpControlChannel::collect(std::vector<pollfd>& fds) const {
  if (fd_ < 0) return;
  short events = 0;
  if (connecting_) events = POLLOUT;
  else events = static_cast<short>(POLLIN | (out_.empty() ? 0 : POLLOUT));
  fds.push_back(pollfd{fd_, events, 0});
}

void TcpControlChannel::fail(const std::string& what) {
  close();
  if (sink_) sink_->on_error(what);
}

void TcpControlChannel::flush() {
  while (!out_.empty()) {
    const ssize_t n = ::send(fd_, out_.data(), out_.size(), MSG_NOSIGNAL);
    if (n > 0) {
      out_.erase(out_.begin(), out_.begin() + n);
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (n < 0 && errno == EINTR) continue;
    fail(errno_reason("write_failed:"));
    return;
  }
}

void TcpControlChannel::dispatch(const pollfd& p, uint32_t now_ms) {
  if (fd_ < 0 || p.fd != fd_) return;
  const int fd = fd_;

  if (connecting_) {
    if (!(p.revents & (POLLOUT | POLLERR | POLLHUP))) return;
    std::string err;
    if (!tcp_connect_finish(fd_, err)) {
      fail(err);
      return;
    }
    connecting_ = false;
    if (sink_) sink_->on_connected(now_ms);
    return;
  }

  if (p.revents & POLLIN) {
    uint8_t buf[4096];
    while (true) {
      const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n > 0) {
        if (sink_) sink_->on_bytes(buf, static_cast<std::size_t>(n));
        if (fd_ != fd) return;   // sink closed us
        continue;
      }
      if (n == 0) {
        close();
        if (sink_) sink_->on_closed();
        return;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      if (errno == EINTR) continue;
      fail(errno_reason("read_failed:"));
      return;
    }
  }

  if (p.revents & POLLOUT) {
    flush();
    if (fd_ != fd) return;
  }

  if (p.revents & (POLLERR | POLLNVAL)) {
    fail("socket_error");
  } else if ((p.revents & POLLHUP) && !(p.revents & POLLIN)) {
    close();
    if (sink_) sink_->on_closed();
  }
}

// ---------------------------------------------------------------------------
// TcpDataChannel
// ---------------------------------------------------------------------------

bool TcpDataChannel::listen(uint16_t& port, std::string& err) {
  close();
  listen_fd_ = tcp_listen_ephemeral(port, err);
  return listen_fd_ >= 0;
}

void TcpDataChannel::serve(std::unique_ptr<PayloadSource> payload) {
  payload_ = std::move(payload);
  chunk_.clear();
  chunk_off_ = 0;
}

void TcpDataChannel::close() {
  close_socket(listen_fd_);
  close_socket(conn_fd_);
  listen_fd_ = -1;
  conn_fd_ = -1;
  payload_.reset();
  chunk_.clear();
  chunk_off_ = 0;
}

void TcpDataChannel::collect(std::vector<pollfd>& fds) const {
  if (listen_fd_ >= 0) fds.push_back(pollfd{listen_fd_, POLLIN, 0});
  // With no payload yet only errors and hangups are of interest.
  if (conn_fd_ >= 0) fds.push_back(pollfd{conn_fd_, static_cast<short>(payload_ ? POLLOUT : 0), 0});
}

void TcpDataChannel::fail(const std::string& what) {
  close();
  if (sink_) sink_->on_data_error(what);
}

void TcpDataChannel::dispatch(const pollfd& p, uint32_t /*now_ms*/) {
  if (listen_fd_ >= 0 && p.fd == listen_fd_) {
    if (p.revents & (POLLERR | POLLNVAL)) {
      fail("listen_failed");
      return;
    }
    if (!(p.revents & POLLIN)) return;
    std::string err;
    const int fd = tcp_accept(listen_fd_, err);
    if (fd < 0) {
      if (!err.empty()) fail(err);
      return;
    }
    // One upload per listener.
    close_socket(listen_fd_);
    listen_fd_ = -1;
    conn_fd_ = fd;
    if (sink_) sink_->on_data_connected();
    return;
  }

  if (conn_fd_ >= 0 && p.fd == conn_fd_) {
    if (p.revents & POLLOUT) {
      pump();
      return;
    }
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) fail("data_connection_lost");
  }
}

void TcpDataChannel::pump() {
  while (conn_fd_ >= 0 && payload_) {
    if (chunk_off_ >= chunk_.size()) {
      chunk_.resize(CHUNK);
      const std::size_t n = payload_->read(chunk_.data(), chunk_.size());
      if (payload_->failed()) {
        fail("payload_read_failed");
        return;
      }
      if (n == 0) {
        close();
        if (sink_) sink_->on_data_closed();
        return;
      }
      chunk_.resize(n);
      chunk_off_ = 0;
    }

    const ssize_t w = ::send(conn_fd_, chunk_.data() + chunk_off_, chunk_.size() - chunk_off_, MSG_NOSIGNAL);
    if (w > 0) {
      chunk_off_ += static_cast<std::size_t>(w);
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
    if (w < 0 && errno == EINTR) continue;
    fail(errno_reason("write_failed:"));
    return;
  }
}

} // namespace zebralink::transport
