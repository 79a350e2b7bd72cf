#pragma once
/**
 * @file reactor.hpp
 * @brief Single-threaded poll(2) loop over non-blocking channels.
 *
 * Each IPollable contributes the descriptors it currently cares about and
 * receives the ready ones back. Descriptors are collected fresh every round,
 * so a channel that closes or opens sockets inside dispatch() is picked up
 * on the next run_once().
 */

#include <poll.h>

#include <cstdint>
#include <string>
#include <vector>

namespace zebralink::transport {

class IPollable {
public:
  virtual ~IPollable() = default;
  virtual void collect(std::vector<pollfd>& fds) const = 0;
  /// Handle readiness of a descriptor this object collected. Descriptors it
  /// no longer owns must be ignored.
  virtual void dispatch(const pollfd& p, uint32_t now_ms) = 0;
};

class Reactor {
public:
  void add(IPollable* p);
  void remove(IPollable* p);

  /// One poll round of at most @p timeout_ms. False only on a poll failure.
  bool run_once(int timeout_ms, uint32_t now_ms, std::string& err);

private:
  std::vector<IPollable*> items_;
  std::vector<pollfd>     fds_;
  std::vector<IPollable*> owners_;
};

} // namespace zebralink::transport
