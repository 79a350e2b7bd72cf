// ============================================================================
// crc.cpp - implementation for crc.hpp
// ============================================================================

#include "zebralink/crc.hpp"

namespace zebralink {

CrcTable make_crc_table(uint32_t reflected_polynomial) {
  CrcTable table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t rem = i;
    for (int bit = 0; bit < 8; ++bit) {
      rem = (rem & 1u) ? (rem >> 1) ^ reflected_polynomial : (rem >> 1);
    }
    table[i] = rem;
  }
  return table;
}

const CrcTable& crc32_table() {
  static const CrcTable t = make_crc_table(CRC32_POLYNOMIAL);
  return t;
}

const CrcTable& crc16_ccitt_table() {
  static const CrcTable t = make_crc_table(CRC16_CCITT_POLYNOMIAL);
  return t;
}

uint32_t crc_compute(const CrcTable& table, const uint8_t* data, std::size_t len, unsigned bits) {
  if (bits < 8)  bits = 8;
  if (bits > 32) bits = 32;
  const uint32_t mask = (bits == 32) ? 0xFFFFFFFFu : ((1u << bits) - 1u);

  uint32_t crc = mask;                      // all ones in the CRC width
  for (std::size_t i = 0; i < len; ++i) {
    crc = (crc >> 8) ^ table[(crc ^ data[i]) & 0xFFu];
  }
  return (crc ^ mask) & mask;
}

uint32_t crc32(const uint8_t* data, std::size_t len) {
  return crc_compute(crc32_table(), data, len, 32);
}

uint16_t crc16_ccitt(const uint8_t* data, std::size_t len) {
  return static_cast<uint16_t>(crc_compute(crc16_ccitt_table(), data, len, 16));
}

uint32_t adler32(const uint8_t* data, std::size_t len) {
  // 5552 is the largest block for which b cannot overflow 32 bits before the modulo.
  static constexpr std::size_t NMAX = 5552;

  uint32_t a = 1;
  uint32_t b = 0;
  while (len > 0) {
    std::size_t n = len < NMAX ? len : NMAX;
    len -= n;
    while (n--) {
      a += *data++;
      b += a;
    }
    a %= ADLER32_MOD;
    b %= ADLER32_MOD;
  }
  return (b << 16) | a;
}

} // namespace zebralink
