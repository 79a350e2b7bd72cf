#pragma once
/**
 * @file payload.hpp
 * @brief Byte sources streamed over an FTP data connection.
 *
 * A PayloadSource hands out bytes in chunks until it reports end of data
 * (read() returns 0). BufferSource serves memory; FileSource reads from disk
 * as the socket drains, so large files are never held in memory whole.
 */

#include "zebralink/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>

namespace zebralink {

class PayloadSource {
public:
  virtual ~PayloadSource() = default;
  /// Copy up to @p cap bytes into @p out; 0 means end of data (or failure).
  virtual std::size_t read(uint8_t* out, std::size_t cap) = 0;
  virtual bool failed() const = 0;
  /// Total size when known up front.
  virtual uint64_t size() const = 0;
};

class BufferSource : public PayloadSource {
public:
  explicit BufferSource(Bytes data) : data_(std::move(data)) {}
  explicit BufferSource(const std::string& text) : data_(to_bytes(text)) {}

  std::size_t read(uint8_t* out, std::size_t cap) override;
  bool failed() const override { return false; }
  uint64_t size() const override { return data_.size(); }

private:
  Bytes data_;
  std::size_t pos_ = 0;
};

class FileSource : public PayloadSource {
public:
  /// nullptr with "not_found:<path>" or "read_failed:<path>" in @p err.
  static std::unique_ptr<FileSource> open(const std::string& path, std::string& err);

  std::size_t read(uint8_t* out, std::size_t cap) override;
  bool failed() const override { return failed_; }
  uint64_t size() const override { return size_; }

private:
  FileSource() = default;
  std::ifstream in_;
  uint64_t size_ = 0;
  bool failed_ = false;
};

} // namespace zebralink
