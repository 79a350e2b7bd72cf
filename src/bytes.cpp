// ============================================================================
// bytes.cpp - implementation for bytes.hpp
// ============================================================================

#include "zebralink/bytes.hpp"

namespace zebralink {

Bytes to_bytes(const std::string& s) {
  return Bytes(s.begin(), s.end());
}

std::string to_string(const uint8_t* data, std::size_t len) {
  return std::string(reinterpret_cast<const char*>(data), len);
}

std::string to_string(const Bytes& b) {
  return to_string(b.data(), b.size());
}

uint32_t read_uint_be(const uint8_t* p, std::size_t width) {
  uint32_t v = 0;
  for (std::size_t i = 0; i < width && i < 4; ++i) {
    v = (v << 8) | p[i];
  }
  return v;
}

void append_u32_be(Bytes& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v >> 24));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v));
}

Bytes concat(const std::vector<const Bytes*>& parts) {
  std::size_t total = 0;
  for (const Bytes* p : parts) total += p->size();
  Bytes out;
  out.reserve(total);
  for (const Bytes* p : parts) out.insert(out.end(), p->begin(), p->end());
  return out;
}

} // namespace zebralink
