#pragma once
/**
 * @file transport_tcp.hpp
 * @brief Linux TCP channels for the FTP session (non-blocking, poll-driven).
 *
 * TcpControlChannel owns the command connection: a pending connect, an
 * outbound byte queue flushed as the socket drains, and a read path that
 * forwards bytes to ControlEvents.
 *
 * TcpDataChannel owns one active-mode upload: a listener on an ephemeral
 * port, the single connection accepted on it, and the payload streamed to
 * that connection. When the payload is exhausted the connection is shut
 * down and DataEvents::on_data_closed() fires.
 *
 * Both register with a Reactor through IPollable. Depends on socket_io.hpp.
 */

#if !defined(__linux__)
#  error "transport_tcp.hpp is Linux-only."
#endif

#include "zebralink/bytes.hpp"
#include "zebralink/transport/reactor.hpp"
#include "zebralink/transport/transport_base.hpp"

#include <memory>
#include <string>
#include <vector>

namespace zebralink::transport {

class TcpControlChannel : public IControlChannel, public IPollable {
public:
  TcpControlChannel() = default;
  ~TcpControlChannel() override { close(); }

  void        bind(ControlEvents* sink) override { sink_ = sink; }
  bool        open(const std::string& host, uint16_t port, std::string& err) override;
  TxResult    send(const uint8_t* data, std::size_t len) override;
  bool        peer_ipv4(uint32_t& addr) const override;
  void        close() override;
  bool        is_open() const override { return fd_ >= 0; }
  const char* name() const override { return "tcp-control"; }

  void collect(std::vector<pollfd>& fds) const override;
  void dispatch(const pollfd& p, uint32_t now_ms) override;

private:
  void flush();
  void fail(const std::string& what);

  ControlEvents* sink_ = nullptr;
  int   fd_ = -1;
  bool  connecting_ = false;
  Bytes out_;
};

class TcpDataChannel : public IDataChannel, public IPollable {
public:
  static constexpr std::size_t CHUNK = 16 * 1024;

  TcpDataChannel() = default;
  ~TcpDataChannel() override { close(); }

  void        bind(DataEvents* sink) override { sink_ = sink; }
  bool        listen(uint16_t& port, std::string& err) override;
  void        serve(std::unique_ptr<PayloadSource> payload) override;
  void        close() override;
  const char* name() const override { return "tcp-data"; }

  void collect(std::vector<pollfd>& fds) const override;
  void dispatch(const pollfd& p, uint32_t now_ms) override;

private:
  void pump();
  void fail(const std::string& what);

  DataEvents* sink_ = nullptr;
  int   listen_fd_ = -1;
  int   conn_fd_ = -1;
  std::unique_ptr<PayloadSource> payload_;
  Bytes       chunk_;
  std::size_t chunk_off_ = 0;
};

} // namespace zebralink::transport
