// ============================================================================
// payload.cpp - implementation for payload.hpp
// ============================================================================

#include "zebralink/payload.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace zebralink {

std::size_t BufferSource::read(uint8_t* out, std::size_t cap) {
  const std::size_t n = std::min(cap, data_.size() - pos_);
  if (n > 0) std::memcpy(out, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

std::unique_ptr<FileSource> FileSource::open(const std::string& path, std::string& err) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    err = "not_found:" + path;
    return nullptr;
  }
  const auto sz = fs::file_size(path, ec);
  if (ec) {
    err = "read_failed:" + path;
    return nullptr;
  }

  std::unique_ptr<FileSource> src(new FileSource());
  src->in_.open(path, std::ios::binary);
  if (!src->in_) {
    err = "read_failed:" + path;
    return nullptr;
  }
  src->size_ = static_cast<uint64_t>(sz);
  return src;
}

std::size_t FileSource::read(uint8_t* out, std::size_t cap) {
  if (failed_ || !in_.is_open()) return 0;
  in_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(cap));
  const std::streamsize got = in_.gcount();
  if (in_.bad()) {
    failed_ = true;
    return 0;
  }
  return got > 0 ? static_cast<std::size_t>(got) : 0;
}

} // namespace zebralink
