#pragma once
/**
 * @file ftp_session.hpp
 * @brief Active-mode FTP client state machine.
 *
 * PURPOSE
 * -------
 * Zebra printers accept label formats and download objects over FTP: any
 * file STORed to the printer is run through the ZPL interpreter. Session
 * speaks just enough of RFC 959 to log in and push bytes:
 * USER, PORT, TYPE I, STOR, NOOP, QUIT, plus whatever raw commands a caller
 * sends.
 *
 * DESIGN
 * ------
 * - Socket-free. The session talks to an IControlChannel and an IDataChannel
 *   and is driven by their events plus tick(now_ms). Tests drive it with mock
 *   channels; FtpClient drives it with TCP channels and a poll loop.
 * - One command on the wire at a time. Commands queue in a bounded deque
 *   (QUEUE_CAP); a full queue completes the new command with Kind::Busy.
 *   Each terminal reply completes the oldest entry. 1xx replies go to the
 *   entry's intermediate callback and leave it waiting.
 * - Every operation completes exactly once through its Completion, possibly
 *   before the call returns when it is rejected up front.
 * - A transport failure completes the oldest entry with the error, then
 *   resets: both channels close and every remaining entry completes with a
 *   Transport error. Nothing fires for a command after that. There is no
 *   automatic reconnect.
 *
 * STATES
 * ------
 *   Disconnected -> Connecting -> Connected <-> AwaitingResponse
 *   any -> Disconnected on reset
 *
 * EXAMPLE
 * -------
 * @code
 *   ftp::Session s(ctl, data, opts);
 *   s.connect("10.0.0.9", 21, "zebra", now, [](const ftp::Outcome& o) { ... });
 *   s.put_data(std::make_unique<BufferSource>(zpl), "", [](const ftp::Outcome& o) { ... });
 * @endcode
 */

#include "zebralink/ftp/ftp_reply.hpp"
#include "zebralink/ipv4.hpp"
#include "zebralink/payload.hpp"
#include "zebralink/transport/transport_base.hpp"

#include "etl/deque.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace zebralink::ftp {

enum class State : uint8_t { Disconnected=0, Connecting=1, Connected=2, AwaitingResponse=3 };
const char* state_name(State s);

struct Error {
  enum class Kind : uint8_t { None=0, Protocol, Transport, Timeout, Busy, NoInterface, Io };

  Kind        kind = Kind::None;
  int         status = 0;        // FTP status for Kind::Protocol
  std::string message;

  /// "530 Not logged in" for protocol errors, the message otherwise.
  std::string to_string() const;
};

const char* error_kind_name(Error::Kind k);

struct Outcome {
  bool  ok = false;
  Reply reply;    // terminal reply when ok (and for protocol errors)
  Error error;

  static Outcome success(Reply r);
  static Outcome failure(Error::Kind kind, std::string message, int status = 0);
};

using Completion     = std::function<void(const Outcome&)>;
using IntermediateFn = std::function<void(const Reply&)>;

enum class LogKind : uint8_t { Command=0, Reply=1, Error=2, Info=3 };
using LogFn = std::function<void(LogKind, const std::string&)>;

/// Local interfaces considered for the PORT address.
using InterfaceProvider = std::function<std::vector<Ipv4Interface>()>;

struct SessionOptions {
  uint32_t          connect_timeout_ms = 5000;
  uint32_t          keepalive_ms       = 60000;   // 0 disables NOOP keep-alive
  LogFn             log;
  InterfaceProvider interfaces;
};

class Session : public transport::ControlEvents, public transport::DataEvents {
public:
  static constexpr std::size_t QUEUE_CAP = 8;

  Session(transport::IControlChannel& control, transport::IDataChannel& data, SessionOptions opts = {});
  ~Session() override;

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Opens the control connection. Completes with the greeting (or the USER
  /// reply when @p user is given).
  void connect(const std::string& host, uint16_t port, const std::string& user,
               uint32_t now_ms, Completion done);

  /// Queues a raw command. Trailing whitespace is trimmed, CR LF appended.
  void send(const std::string& command, Completion done, IntermediateFn on_intermediate = {});

  /// Uploads @p payload as @p filename (default "{unix_ms}.zpl"). Completes
  /// after both the STOR reply and the data connection close.
  void put_data(std::unique_ptr<PayloadSource> payload, const std::string& filename, Completion done);

  /// Uploads a file from disk under its basename.
  void put_file(const std::string& path, Completion done);

  /// QUIT when connected, then reset. Completes ok when already disconnected.
  void disconnect(Completion done);

  /// Connect timeout and keep-alive.
  void tick(uint32_t now_ms);

  State       state() const;
  bool        transfer_active() const { return transfer_.active; }
  std::size_t pending() const { return queue_.size(); }

  // transport::ControlEvents
  void on_connected(uint32_t now_ms) override;
  void on_bytes(const uint8_t* data, std::size_t len) override;
  void on_error(const std::string& what) override;
  void on_closed() override;

  // transport::DataEvents
  void on_data_connected() override;
  void on_data_closed() override;
  void on_data_error(const std::string& what) override;

private:
  struct Pending {
    std::string    command;      // empty for the greeting
    Completion     done;
    IntermediateFn on_intermediate;
    bool           written = false;
  };

  struct Transfer {
    bool        active = false;
    uint32_t    id = 0;
    bool        data_closed = false;
    bool        reply_done = false;
    bool        data_failed = false;
    std::string data_error;
    Outcome     reply;
    std::unique_ptr<PayloadSource> payload;
    Completion  done;
  };

  void enqueue(Pending p);
  void write_next();
  void handle_reply(const Reply& r);
  void complete_front(const Outcome& o);
  void reset(const Error& why);
  void maybe_finish_transfer();
  void finish_transfer(const Outcome& o);
  bool transfer_is(uint32_t id) const { return transfer_.active && transfer_.id == id; }
  void log(LogKind kind, const std::string& msg) const;

  static std::string default_filename();

  transport::IControlChannel& control_;
  transport::IDataChannel&    data_;
  SessionOptions              opts_;

  etl::deque<Pending, QUEUE_CAP> queue_;
  ReplyDecoder decoder_;
  Transfer     transfer_;
  State        state_ = State::Disconnected;

  uint32_t now_ms_ = 0;
  uint32_t connect_started_ms_ = 0;
  bool     connect_timer_armed_ = false;
  uint32_t keepalive_last_ms_ = 0;
  bool     keepalive_armed_ = false;

  uint32_t epoch_ = 0;          // bumped by every reset
  uint32_t transfer_seq_ = 0;
  bool     resetting_ = false;
};

} // namespace zebralink::ftp
