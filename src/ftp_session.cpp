// ============================================================================
// ftp_session.cpp - implementation for ftp_session.hpp
// ============================================================================

#include "zebralink/ftp/ftp_session.hpp"

#include <chrono>
#include <filesystem>
#include <utility>

namespace zebralink::ftp {

using Kind = Error::Kind;

const char* state_name(State s) {
  switch (s) {
    case State::Disconnected:     return "disconnected";
    case State::Connecting:       return "connecting";
    case State::Connected:        return "connected";
    case State::AwaitingResponse: return "awaiting_response";
  }
  return "unknown";
}

const char* error_kind_name(Error::Kind k) {
  switch (k) {
    case Kind::None:        return "none";
    case Kind::Protocol:    return "protocol";
    case Kind::Transport:   return "transport";
    case Kind::Timeout:     return "timeout";
    case Kind::Busy:        return "busy";
    case Kind::NoInterface: return "no_interface";
    case Kind::Io:          return "io";
  }
  return "unknown";
}

std::string Error::to_string() const {
  if (kind == Kind::Protocol) return std::to_string(status) + " " + message;
  return message;
}

Outcome Outcome::success(Reply r) {
  Outcome o;
  o.ok = true;
  o.reply = std::move(r);
  return o;
}

Outcome Outcome::failure(Error::Kind kind, std::string message, int status) {
  Outcome o;
  o.error.kind = kind;
  o.error.status = status;
  o.error.message = std::move(message);
  return o;
}

static std::string rtrim(const std::string& s) {
  std::size_t end = s.size();
  while (end > 0 && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n'))
    --end;
  return s.substr(0, end);
}

Session::Session(transport::IControlChannel& control, transport::IDataChannel& data, SessionOptions opts)
  : control_(control), data_(data), opts_(std::move(opts)) {
  control_.bind(this);
  data_.bind(this);
}

Session::~Session() {
  control_.bind(nullptr);
  data_.bind(nullptr);
  control_.close();
  data_.close();
}

State Session::state() const {
  if (state_ == State::Connected && !queue_.empty()) return State::AwaitingResponse;
  return state_;
}

void Session::log(LogKind kind, const std::string& msg) const {
  if (opts_.log) opts_.log(kind, msg);
}

std::string Session::default_filename() {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
  return std::to_string(ms) + ".zpl";
}

// ---------------------------------------------------------------------------
// connect
// ---------------------------------------------------------------------------

void Session::connect(const std::string& host, uint16_t port, const std::string& user,
                      uint32_t now_ms, Completion done) {
  now_ms_ = now_ms;
  if (state_ != State::Disconnected) {
    if (done) done(Outcome::failure(Kind::Busy, "already connected"));
    return;
  }

  decoder_.reset();
  state_ = State::Connecting;
  connect_started_ms_ = now_ms;
  connect_timer_armed_ = opts_.connect_timeout_ms > 0;
  keepalive_armed_ = false;

  // The greeting is answered without a command, so it sits in the queue as
  // an already-written entry.
  Pending greeting;
  greeting.written = true;
  greeting.done = [this, epoch = epoch_, user, done](const Outcome& o) {
    connect_timer_armed_ = false;
    if (!o.ok) {
      if (epoch == epoch_) reset(o.error);
      if (done) done(o);
      return;
    }
    state_ = State::Connected;
    log(LogKind::Info, "connected");
    if (user.empty()) {
      keepalive_armed_ = true;
      keepalive_last_ms_ = now_ms_;
      if (done) done(o);
      return;
    }
    send("USER " + user, [this, epoch, done](const Outcome& u) {
      if (!u.ok) {
        if (epoch == epoch_) reset(u.error);
        if (done) done(u);
        return;
      }
      keepalive_armed_ = true;
      keepalive_last_ms_ = now_ms_;
      if (done) done(u);
    });
  };
  queue_.push_back(std::move(greeting));

  log(LogKind::Info, "connecting to " + host + ":" + std::to_string(port));
  std::string err;
  if (!control_.open(host, port, err)) {
    log(LogKind::Error, err);
    reset(Error{Kind::Transport, 0, err});
  }
}

// ---------------------------------------------------------------------------
// command queue
// ---------------------------------------------------------------------------

void Session::send(const std::string& command, Completion done, IntermediateFn on_intermediate) {
  if (state_ != State::Connected) {
    if (done) done(Outcome::failure(Kind::Transport, "not connected"));
    return;
  }
  if (queue_.full()) {
    if (done) done(Outcome::failure(Kind::Busy, "command queue full"));
    return;
  }
  Pending p;
  p.command = rtrim(command);
  p.done = std::move(done);
  p.on_intermediate = std::move(on_intermediate);
  enqueue(std::move(p));
}

void Session::enqueue(Pending p) {
  queue_.push_back(std::move(p));
  write_next();
}

void Session::write_next() {
  if (queue_.empty()) return;
  Pending& p = queue_.front();
  if (p.written) return;
  p.written = true;

  log(LogKind::Command, p.command);
  const std::string line = p.command + "\r\n";
  if (control_.send(reinterpret_cast<const uint8_t*>(line.data()), line.size()) != transport::TxResult::Ok)
    on_error("write_failed");
}

void Session::complete_front(const Outcome& o) {
  Pending p = std::move(queue_.front());
  queue_.pop_front();
  const uint32_t epoch = epoch_;
  if (p.done) p.done(o);
  if (epoch == epoch_) write_next();
}

void Session::handle_reply(const Reply& r) {
  for (const auto& line : r.lines) log(LogKind::Reply, "> " + line);

  if (queue_.empty()) {
    log(LogKind::Info, "unsolicited reply " + std::to_string(r.status));
    return;
  }
  if (r.intermediate()) {
    const IntermediateFn cb = queue_.front().on_intermediate;
    if (cb) cb(r);
    return;
  }
  if (r.failure()) {
    Outcome o = Outcome::failure(Kind::Protocol, r.text, r.status);
    o.reply = r;
    complete_front(o);
    return;
  }
  complete_front(Outcome::success(r));
}

// ---------------------------------------------------------------------------
// reset
// ---------------------------------------------------------------------------

void Session::reset(const Error& why) {
  ++epoch_;
  control_.close();
  data_.close();
  state_ = State::Disconnected;
  connect_timer_armed_ = false;
  keepalive_armed_ = false;
  decoder_.reset();

  std::vector<Pending> pending;
  while (!queue_.empty()) {
    pending.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  Transfer t = std::move(transfer_);
  transfer_ = Transfer{};

  const Outcome failed = Outcome::failure(why.kind == Kind::None ? Kind::Transport : why.kind,
                                          why.message, why.status);
  for (auto& p : pending)
    if (p.done) p.done(failed);
  if (t.active && t.done) t.done(failed);
}

// ---------------------------------------------------------------------------
// transfers
// ---------------------------------------------------------------------------

void Session::put_data(std::unique_ptr<PayloadSource> payload, const std::string& filename, Completion done) {
  if (state_ != State::Connected) {
    if (done) done(Outcome::failure(Kind::Transport, "not connected"));
    return;
  }
  if (transfer_.active) {
    if (done) done(Outcome::failure(Kind::Busy, "transfer in progress"));
    return;
  }
  if (!payload) {
    if (done) done(Outcome::failure(Kind::Io, "no payload"));
    return;
  }

  uint16_t port = 0;
  std::string err;
  if (!data_.listen(port, err)) {
    if (done) done(Outcome::failure(Kind::Transport, err));
    return;
  }

  uint32_t peer = 0;
  if (!control_.peer_ipv4(peer)) {
    data_.close();
    if (done) done(Outcome::failure(Kind::Transport, "peer_unknown"));
    return;
  }
  const std::vector<Ipv4Interface> ifaces = opts_.interfaces ? opts_.interfaces() : std::vector<Ipv4Interface>{};
  Ipv4Interface local;
  if (!find_shared_subnet(ifaces, peer, local)) {
    data_.close();
    if (done) done(Outcome::failure(Kind::NoInterface, "no local interface on the subnet of " + format_ipv4(peer)));
    return;
  }
  log(LogKind::Info, "data port " + format_ipv4(local.address) + ":" + std::to_string(port) + " on " + local.name);

  transfer_ = Transfer{};
  transfer_.active = true;
  transfer_.id = ++transfer_seq_;
  transfer_.payload = std::move(payload);
  transfer_.done = std::move(done);

  const uint32_t id = transfer_.id;
  const std::string name = filename.empty() ? default_filename() : filename;

  send("PORT " + format_port_argument(local.address, port), [this, id, name](const Outcome& o) {
    if (!transfer_is(id)) return;
    if (!o.ok) { finish_transfer(o); return; }

    send("TYPE I", [this, id, name](const Outcome& t) {
      if (!transfer_is(id)) return;
      if (!t.ok) { finish_transfer(t); return; }

      data_.serve(std::move(transfer_.payload));
      send("STOR " + name,
           [this, id](const Outcome& s) {
             if (!transfer_is(id)) return;
             transfer_.reply_done = true;
             transfer_.reply = s;
             if (!s.ok) { finish_transfer(s); return; }
             maybe_finish_transfer();
           },
           [this](const Reply& r) { log(LogKind::Info, "transfer started: " + r.to_string()); });
    });
  });
}

void Session::put_file(const std::string& path, Completion done) {
  std::string err;
  std::unique_ptr<FileSource> src = FileSource::open(path, err);
  if (!src) {
    if (done) done(Outcome::failure(Kind::Io, err));
    return;
  }
  put_data(std::move(src), std::filesystem::path(path).filename().string(), std::move(done));
}

void Session::maybe_finish_transfer() {
  if (!transfer_.reply_done || !transfer_.data_closed) return;
  if (transfer_.data_failed)
    finish_transfer(Outcome::failure(Kind::Io, transfer_.data_error));
  else
    finish_transfer(transfer_.reply);
}

void Session::finish_transfer(const Outcome& o) {
  data_.close();
  Completion done = std::move(transfer_.done);
  transfer_ = Transfer{};
  if (done) done(o);
}

// ---------------------------------------------------------------------------
// disconnect / tick
// ---------------------------------------------------------------------------

void Session::disconnect(Completion done) {
  if (state_ == State::Connected) {
    send("QUIT", [this, epoch = epoch_, done](const Outcome& o) {
      if (epoch == epoch_) reset(Error{Kind::Transport, 0, "disconnected"});
      if (done) done(o);
    });
    return;
  }
  if (state_ == State::Connecting) reset(Error{Kind::Transport, 0, "disconnected"});
  if (done) done(Outcome::success(Reply{}));
}

void Session::tick(uint32_t now_ms) {
  now_ms_ = now_ms;

  if (state_ == State::Connecting && connect_timer_armed_ &&
      now_ms - connect_started_ms_ >= opts_.connect_timeout_ms) {
    const std::string msg = "connect timed out after " + std::to_string(opts_.connect_timeout_ms) + " ms";
    log(LogKind::Error, msg);
    reset(Error{Kind::Timeout, 0, msg});
    return;
  }

  if (keepalive_armed_ && state_ == State::Connected && opts_.keepalive_ms > 0 &&
      now_ms - keepalive_last_ms_ >= opts_.keepalive_ms) {
    keepalive_last_ms_ = now_ms;
    if (!queue_.empty() || transfer_.active) return;
    send("NOOP", [this, epoch = epoch_](const Outcome& o) {
      if (o.ok || epoch != epoch_) return;
      const std::string msg = "keep-alive failed: " + o.error.to_string();
      log(LogKind::Error, msg);
      reset(Error{Kind::Transport, 0, msg});
    });
  }
}

// ---------------------------------------------------------------------------
// channel events
// ---------------------------------------------------------------------------

void Session::on_connected(uint32_t now_ms) {
  now_ms_ = now_ms;
  log(LogKind::Info, std::string("control channel open (") + control_.name() + ")");
}

void Session::on_bytes(const uint8_t* data, std::size_t len) {
  if (state_ == State::Disconnected) return;
  const uint32_t epoch = epoch_;
  Reply r;
  for (std::size_t i = 0; i < len; ++i) {
    if (decoder_.feed(data[i], r)) {
      handle_reply(r);
      if (epoch != epoch_) return;
    }
    if (decoder_.overflowed()) {
      on_error("reply exceeds " + std::to_string(ReplyDecoder::BLOCK_MAX) + " bytes");
      return;
    }
  }
}

void Session::on_error(const std::string& what) {
  if (state_ == State::Disconnected && queue_.empty()) return;
  log(LogKind::Error, what);

  const uint32_t epoch = epoch_;
  if (!queue_.empty()) {
    Pending p = std::move(queue_.front());
    queue_.pop_front();
    if (p.done) p.done(Outcome::failure(Kind::Transport, what));
  }
  if (epoch == epoch_) reset(Error{Kind::Transport, 0, what});
}

void Session::on_closed() {
  if (state_ == State::Disconnected) return;
  log(LogKind::Info, "connection closed by peer");
  reset(Error{Kind::Transport, 0, "connection closed"});
}

void Session::on_data_connected() {
  if (transfer_.active) log(LogKind::Info, "printer connected to data port");
}

void Session::on_data_closed() {
  if (!transfer_.active) return;
  transfer_.data_closed = true;
  maybe_finish_transfer();
}

void Session::on_data_error(const std::string& what) {
  if (!transfer_.active) return;
  log(LogKind::Error, what);
  transfer_.data_failed = true;
  transfer_.data_error = what;
  transfer_.data_closed = true;
  maybe_finish_transfer();
}

} // namespace zebralink::ftp
