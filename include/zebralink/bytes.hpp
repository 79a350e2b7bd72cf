#pragma once
/**
 * @file bytes.hpp
 * @brief Byte buffer alias and the handful of conversions the codecs share.
 *
 * Text handled by zebralink is treated as Latin-1: one char is one byte, no
 * transcoding in either direction. ZPL and FTP are both byte protocols, so
 * this keeps string and byte renderings of a command identical byte for byte.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zebralink {

using Bytes = std::vector<uint8_t>;

/// Copy each char of @p s into one byte.
Bytes to_bytes(const std::string& s);

/// Copy each byte into one char.
std::string to_string(const uint8_t* data, std::size_t len);
std::string to_string(const Bytes& b);

/**
 * @brief Read an unsigned big-endian integer of @p width bytes (1..4).
 * @note The caller guarantees @p width bytes are readable at @p p.
 */
uint32_t read_uint_be(const uint8_t* p, std::size_t width);

inline uint32_t read_u32_be(const uint8_t* p) { return read_uint_be(p, 4); }
inline uint16_t read_u16_be(const uint8_t* p) { return static_cast<uint16_t>(read_uint_be(p, 2)); }

/// Append @p v as four big-endian bytes.
void append_u32_be(Bytes& out, uint32_t v);

/// Concatenate buffers with one allocation.
Bytes concat(const std::vector<const Bytes*>& parts);

} // namespace zebralink
