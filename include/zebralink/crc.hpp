#pragma once
/**
 * @file crc.hpp
 * @brief Table-driven CRC and Adler-32 checksums.
 *
 * @details
 * CRCs here use the reflected (LSB-first) form: a 256-entry remainder table
 * is built from a reflected polynomial, the register starts at all ones, each
 * byte is folded in with `crc = (crc >> 8) ^ table[(crc ^ b) & 0xFF]`, and the
 * result is complemented and masked to the CRC width.
 *
 *   crc32()        polynomial 0xEDB88320 (PNG, zlib)  "123456789" -> 0xCBF43926
 *   crc16_ccitt()  polynomial 0x8408 (X.25 form)      "123456789" -> 0x906E
 *
 * Adler-32 (zlib stream trailer) keeps two sums modulo 65521 and packs them
 * as (b << 16) | a. The empty input yields 1.
 */

#include <array>
#include <cstddef>
#include <cstdint>

#include "zebralink/bytes.hpp"

namespace zebralink {

static constexpr uint32_t CRC32_POLYNOMIAL       = 0xEDB88320u;
static constexpr uint32_t CRC16_CCITT_POLYNOMIAL = 0x8408u;

using CrcTable = std::array<uint32_t, 256>;

/// Remainder table for a reflected polynomial.
CrcTable make_crc_table(uint32_t reflected_polynomial);

/// Shared tables, built on first use.
const CrcTable& crc32_table();
const CrcTable& crc16_ccitt_table();

/// Generic reflected CRC of @p bits width (8..32) using @p table.
uint32_t crc_compute(const CrcTable& table, const uint8_t* data, std::size_t len, unsigned bits = 32);

uint32_t crc32(const uint8_t* data, std::size_t len);
inline uint32_t crc32(const Bytes& b) { return crc32(b.data(), b.size()); }

uint16_t crc16_ccitt(const uint8_t* data, std::size_t len);
inline uint16_t crc16_ccitt(const Bytes& b) { return crc16_ccitt(b.data(), b.size()); }

static constexpr uint32_t ADLER32_MOD = 65521u;

uint32_t adler32(const uint8_t* data, std::size_t len);
inline uint32_t adler32(const Bytes& b) { return adler32(b.data(), b.size()); }

} // namespace zebralink
