#pragma once
/**
 * @file ftp_client.hpp
 * @brief Blocking FTP client for the Linux host, built on ftp::Session.
 *
 * @details
 * PURPOSE
 * -------
 * The CLI wants "connect, upload, quit" as plain calls. FtpClient owns the
 * session, the TCP channels and a Reactor, starts one session operation and
 * runs the poll loop (ticking the session with a steady clock) until that
 * operation completes.
 *
 * EXAMPLE
 * -------
 * @code
 *   zebralink::FtpClient ftp;
 *   auto c = ftp.connect("10.0.0.9", 21, "zebra");
 *   if (!c.ok) { std::cerr << c.error.to_string() << "\n"; return 1; }
 *   auto u = ftp.put_data(label.render_string());
 *   ftp.disconnect();
 * @endcode
 */

#include "zebralink/bytes.hpp"
#include "zebralink/ftp/ftp_session.hpp"
#include "zebralink/transport/reactor.hpp"
#include "zebralink/transport/transport_tcp.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace zebralink {

struct FtpClientOptions {
  uint32_t   connect_timeout_ms = 5000;
  uint32_t   keepalive_ms = 60000;
  int        poll_interval_ms = 50;
  ftp::LogFn log;
};

class FtpClient {
public:
  explicit FtpClient(FtpClientOptions opts = {});

  FtpClient(const FtpClient&) = delete;
  FtpClient& operator=(const FtpClient&) = delete;

  ftp::Outcome connect(const std::string& host, uint16_t port = 21, const std::string& user = "");
  ftp::Outcome send(const std::string& command);
  ftp::Outcome put_data(const Bytes& data, const std::string& filename = "");
  ftp::Outcome put_data(const std::string& data, const std::string& filename = "");
  ftp::Outcome put_file(const std::string& path);
  ftp::Outcome disconnect();

  ftp::State state() const { return session_.state(); }

private:
  ftp::Outcome run(const std::function<void(ftp::Completion)>& start);
  static uint32_t now_ms();

  transport::TcpControlChannel control_;
  transport::TcpDataChannel    data_;
  ftp::Session                 session_;
  transport::Reactor           reactor_;
  int                          poll_interval_ms_;
};

} // namespace zebralink
