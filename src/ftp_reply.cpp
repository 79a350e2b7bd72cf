// ============================================================================
// ftp_reply.cpp - implementation for ftp_reply.hpp
// ============================================================================

#include "zebralink/ftp/ftp_reply.hpp"

namespace zebralink::ftp {

static bool status_prefix(const std::string& line, int& status) {
  if (line.size() < 3) return false;
  for (std::size_t i = 0; i < 3; ++i)
    if (line[i] < '0' || line[i] > '9') return false;
  status = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
  return true;
}

std::string Reply::to_string() const {
  return text.empty() ? std::to_string(status) : std::to_string(status) + " " + text;
}

void ReplyDecoder::reset() {
  line_.clear();
  partial_ = Reply{};
  partial_bytes_ = 0;
  multiline_ = false;
  discarding_ = false;
  overflowed_ = false;
}

bool ReplyDecoder::feed(uint8_t b, Reply& out) {
  if (b == '\n') {
    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
    const bool done = complete_line(out);
    line_.clear();
    return done;
  }
  if (line_.size() < LINE_MAX) line_.push_back(static_cast<char>(b));
  return false;
}

bool ReplyDecoder::complete_line(Reply& out) {
  int status = 0;
  const bool has_status = status_prefix(line_, status);

  if (multiline_) {
    const bool closing = has_status && status == partial_.status && line_.size() > 3 && line_[3] == ' ';
    if (discarding_) {
      if (closing) {
        partial_ = Reply{};
        multiline_ = false;
        discarding_ = false;
      }
      return false;
    }

    partial_bytes_ += line_.size();
    if (partial_bytes_ > BLOCK_MAX) {
      ++malformed_;
      overflowed_ = true;
      partial_.lines.clear();
      partial_bytes_ = 0;
      if (closing) {
        partial_ = Reply{};
        multiline_ = false;
      } else {
        discarding_ = true;
      }
      return false;
    }

    partial_.lines.push_back(line_);
    if (closing) {
      out = std::move(partial_);
      partial_ = Reply{};
      partial_bytes_ = 0;
      multiline_ = false;
      return true;
    }
    return false;
  }

  if (!has_status || (line_.size() > 3 && line_[3] != ' ' && line_[3] != '-')) {
    if (!line_.empty()) ++malformed_;
    return false;
  }

  Reply r;
  r.status = status;
  r.text = line_.size() > 4 ? line_.substr(4) : std::string();
  r.lines.push_back(line_);

  if (line_.size() > 3 && line_[3] == '-') {
    partial_ = std::move(r);
    partial_bytes_ = line_.size();
    multiline_ = true;
    return false;
  }
  out = std::move(r);
  return true;
}

} // namespace zebralink::ftp
