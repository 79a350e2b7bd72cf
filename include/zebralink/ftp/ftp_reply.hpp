#pragma once
/**
 * @file ftp_reply.hpp
 * @brief FTP control-connection reply framing.
 *
 * A reply is a three-digit status followed by text:
 *
 *   220 printer ready\r\n
 *
 * Multi-line replies open with `DDD-` and close with a line starting with
 * the same code and a space:
 *
 *   211-Features:\r\n
 *    PASV\r\n
 *   211 End\r\n
 *
 * ReplyDecoder is fed one byte at a time from the socket read path and
 * reports each complete reply. Lines ending in bare LF are accepted. Lines
 * that do not start with a status code outside a multi-line block are
 * counted and dropped.
 *
 * A multi-line block is capped at BLOCK_MAX bytes. Past the cap the block is
 * dropped, counted as malformed, and the decoder discards input up to the
 * block's closing line. overflowed() stays set until reset().
 *
 * Status classes: 1xx intermediate, 2xx/3xx success, 4xx/5xx failure.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zebralink::ftp {

struct Reply {
  int                      status = 0;
  std::string              text;      // text of the first line
  std::vector<std::string> lines;     // every raw line, in order

  bool intermediate() const { return status >= 100 && status < 200; }
  bool failure() const      { return status >= 400; }
  /// "DDD text"
  std::string to_string() const;
};

class ReplyDecoder {
public:
  static constexpr std::size_t LINE_MAX  = 4096;
  static constexpr std::size_t BLOCK_MAX = 64 * 1024;

  /// Returns true when @p out holds a complete reply.
  bool feed(uint8_t b, Reply& out);
  void reset();
  std::size_t malformed() const { return malformed_; }
  bool overflowed() const { return overflowed_; }

private:
  bool complete_line(Reply& out);

  std::string line_;
  Reply       partial_;
  std::size_t partial_bytes_ = 0;
  bool        multiline_  = false;
  bool        discarding_ = false;
  bool        overflowed_ = false;
  std::size_t malformed_ = 0;
};

} // namespace zebralink::ftp
