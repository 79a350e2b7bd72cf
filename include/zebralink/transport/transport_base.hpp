#pragma once
/**
 * @file transport_base.hpp
 * @brief Socket-agnostic channel interfaces used by the FTP session.
 *
 * The FTP session never touches a file descriptor. It drives two channels:
 *
 *  - IControlChannel: the command connection. open() only starts the
 *    connect; completion, incoming bytes, errors and remote close come back
 *    through ControlEvents.
 *  - IDataChannel: the active-mode data connection. listen() binds an
 *    ephemeral port, serve() hands over the payload to stream to the first
 *    peer that connects. Progress comes back through DataEvents.
 *
 * Contract:
 *  - Calling close() never raises an event.
 *  - Events are delivered from the owner's poll loop, never from inside
 *    open()/listen()/send()/serve().
 *  - send() never blocks; bytes are queued and flushed as the socket drains.
 */

#include "zebralink/payload.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace zebralink::transport {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

class ControlEvents {
public:
  virtual ~ControlEvents() = default;
  virtual void on_connected(uint32_t now_ms) = 0;
  virtual void on_bytes(const uint8_t* data, std::size_t len) = 0;
  virtual void on_error(const std::string& what) = 0;
  virtual void on_closed() = 0;
};

class DataEvents {
public:
  virtual ~DataEvents() = default;
  virtual void on_data_connected() = 0;
  /// Payload fully written and the connection shut down.
  virtual void on_data_closed() = 0;
  virtual void on_data_error(const std::string& what) = 0;
};

class IControlChannel {
public:
  virtual ~IControlChannel() = default;
  virtual void        bind(ControlEvents* sink) = 0;
  virtual bool        open(const std::string& host, uint16_t port, std::string& err) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  /// Remote address of the open connection, host order.
  virtual bool        peer_ipv4(uint32_t& addr) const = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual const char* name() const = 0;
};

class IDataChannel {
public:
  virtual ~IDataChannel() = default;
  virtual void        bind(DataEvents* sink) = 0;
  virtual bool        listen(uint16_t& port, std::string& err) = 0;
  virtual void        serve(std::unique_ptr<PayloadSource> payload) = 0;
  virtual void        close() = 0;
  virtual const char* name() const = 0;
};

} // namespace zebralink::transport
