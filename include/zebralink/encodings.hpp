#pragma once
/**
 * @file encodings.hpp
 * @brief Byte-to-text encoders used to embed binary payloads in ZPL.
 *
 * Hex is what ~DY downloads carry (format code 'P'). Base64 is provided for
 * diagnostics and tooling only: the printer expects a proprietary CRC-16
 * trailer on base64-framed downloads, so download objects never use it.
 */

#include "zebralink/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace zebralink {

/// Two lower-case hex digits per byte.
std::string to_hex(const uint8_t* data, std::size_t len);
inline std::string to_hex(const Bytes& b) { return to_hex(b.data(), b.size()); }

/**
 * @brief Decode hex text (either case, even length).
 * @return false on odd length or a non-hex character; @p out is cleared first.
 */
bool from_hex(const std::string& hex, Bytes& out);

/// RFC 4648 base64 with '=' padding.
std::string to_base64(const uint8_t* data, std::size_t len);
inline std::string to_base64(const Bytes& b) { return to_base64(b.data(), b.size()); }

} // namespace zebralink
