// ============================================================================
// encodings.cpp - implementation for encodings.hpp
// ============================================================================

#include "zebralink/encodings.hpp"

namespace zebralink {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string to_hex(const uint8_t* data, std::size_t len) {
  static const char* DIGITS = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out.push_back(DIGITS[data[i] >> 4]);
    out.push_back(DIGITS[data[i] & 0x0F]);
  }
  return out;
}

bool from_hex(const std::string& hex, Bytes& out) {
  out.clear();
  if (hex.size() % 2 != 0) return false;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = hex_value(hex[i]);
    const int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) { out.clear(); return false; }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string to_base64(const uint8_t* data, std::size_t len) {
  static const char* ALPHABET =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((len + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 3 <= len; i += 3) {                         // full 3-byte groups
    const uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
    out.push_back(ALPHABET[(n >> 18) & 0x3F]);
    out.push_back(ALPHABET[(n >> 12) & 0x3F]);
    out.push_back(ALPHABET[(n >> 6) & 0x3F]);
    out.push_back(ALPHABET[n & 0x3F]);
  }

  const std::size_t rest = len - i;                      // 0, 1 or 2 trailing bytes
  if (rest == 1) {
    const uint32_t n = uint32_t(data[i]) << 16;
    out.push_back(ALPHABET[(n >> 18) & 0x3F]);
    out.push_back(ALPHABET[(n >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    const uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out.push_back(ALPHABET[(n >> 18) & 0x3F]);
    out.push_back(ALPHABET[(n >> 12) & 0x3F]);
    out.push_back(ALPHABET[(n >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

} // namespace zebralink
