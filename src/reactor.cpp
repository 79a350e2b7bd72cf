// ============================================================================
// reactor.cpp - implementation for reactor.hpp
// ============================================================================

#include "zebralink/transport/reactor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace zebralink::transport {

void Reactor::add(IPollable* p) {
  if (p && std::find(items_.begin(), items_.end(), p) == items_.end()) items_.push_back(p);
}

void Reactor::remove(IPollable* p) {
  items_.erase(std::remove(items_.begin(), items_.end(), p), items_.end());
}

bool Reactor::run_once(int timeout_ms, uint32_t now_ms, std::string& err) {
  fds_.clear();
  owners_.clear();
  for (IPollable* item : items_) {
    const std::size_t before = fds_.size();
    item->collect(fds_);
    owners_.insert(owners_.end(), fds_.size() - before, item);
  }

  const int rc = ::poll(fds_.empty() ? nullptr : fds_.data(), static_cast<nfds_t>(fds_.size()), timeout_ms);
  if (rc < 0) {
    if (errno == EINTR) return true;
    err = std::string("poll_failed:") + std::strerror(errno);
    return false;
  }
  if (rc == 0) return true;

  for (std::size_t i = 0; i < fds_.size(); ++i) {
    if (fds_[i].revents == 0) continue;
    owners_[i]->dispatch(fds_[i], now_ms);
  }
  return true;
}

} // namespace zebralink::transport
