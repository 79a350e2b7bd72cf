// ============================================================================
// ftp_client.cpp - implementation for ftp_client.hpp
// ============================================================================

#include "ftp_client.hpp"
#include "socket_io.hpp"
#include "zebralink/payload.hpp"

#include <chrono>
#include <memory>

namespace zebralink {

static ftp::SessionOptions session_options(const FtpClientOptions& o) {
  ftp::SessionOptions s;
  s.connect_timeout_ms = o.connect_timeout_ms;
  s.keepalive_ms = o.keepalive_ms;
  s.log = o.log;
  s.interfaces = [] { return list_ipv4_interfaces(); };
  return s;
}

FtpClient::FtpClient(FtpClientOptions opts)
  : session_(control_, data_, session_options(opts)),
    poll_interval_ms_(opts.poll_interval_ms > 0 ? opts.poll_interval_ms : 50) {
  reactor_.add(&control_);
  reactor_.add(&data_);
}

uint32_t FtpClient::now_ms() {
  using namespace std::chrono;
  return static_cast<uint32_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

// ---------------------------------------------------------------------------
// run()
// -----
// Start one session operation and poll until its completion fires. The
// session's own timers (connect timeout) bound the wait; a poll failure is
// reported to the session as a transport error, which completes everything.
// ---------------------------------------------------------------------------
ftp::Outcome FtpClient::run(const std::function<void(ftp::Completion)>& start) {
  bool done = false;
  ftp::Outcome result;
  start([&done, &result](const ftp::Outcome& o) {
    result = o;
    done = true;
  });

  std::string err;
  while (!done) {
    if (!reactor_.run_once(poll_interval_ms_, now_ms(), err)) {
      session_.on_error(err);
      if (!done) result = ftp::Outcome::failure(ftp::Error::Kind::Transport, err);
      break;
    }
    session_.tick(now_ms());
  }
  return result;
}

ftp::Outcome FtpClient::connect(const std::string& host, uint16_t port, const std::string& user) {
  return run([&](ftp::Completion done) { session_.connect(host, port, user, now_ms(), std::move(done)); });
}

ftp::Outcome FtpClient::send(const std::string& command) {
  return run([&](ftp::Completion done) { session_.send(command, std::move(done)); });
}

ftp::Outcome FtpClient::put_data(const Bytes& data, const std::string& filename) {
  return run([&](ftp::Completion done) {
    session_.put_data(std::make_unique<BufferSource>(data), filename, std::move(done));
  });
}

ftp::Outcome FtpClient::put_data(const std::string& data, const std::string& filename) {
  return put_data(to_bytes(data), filename);
}

ftp::Outcome FtpClient::put_file(const std::string& path) {
  return run([&](ftp::Completion done) { session_.put_file(path, std::move(done)); });
}

ftp::Outcome FtpClient::disconnect() {
  return run([&](ftp::Completion done) { session_.disconnect(std::move(done)); });
}

} // namespace zebralink
