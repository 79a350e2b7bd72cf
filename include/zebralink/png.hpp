#pragma once
/**
 * @page zl-png PNG Chunk Parser
 * @file png.hpp
 * @brief Signature check, chunk walk, CRC verification and field decoding for PNG files.
 *
 * @details
 * FILE LAYOUT
 * -----------
 *   8-byte signature   89 50 4E 47 0D 0A 1A 0A
 *   chunk*             length (u32 BE) | type (4 ASCII) | data (length) | CRC (u32 BE)
 *
 * The CRC covers type + data and uses CRC-32 (crc.hpp). Each chunk's expected
 * CRC is computed and compared; a mismatch marks that chunk with
 * crc_matched = false and makes parse_png() return PngStatus::CrcMismatch.
 * The corrupt chunk is still returned with its type, length and raw data so
 * callers can report it, but its contents must not be trusted.
 *
 * TYPE FLAGS
 * ----------
 * Bit 5 (the ASCII case bit) of each type byte carries meaning:
 *   byte 0 upper-case: critical       (lower: ancillary)
 *   byte 1 upper-case: public         (lower: private)
 *   byte 2 upper-case: reserved bit valid (lower: chunk is not understood)
 *   byte 3 lower-case: safe to copy
 *
 * DECODED CHUNKS
 * --------------
 *   IHDR  width, height, bit depth, color type, compression, filter, interlace
 *   PLTE  RGB palette entries
 *   pHYs  pixels per unit X/Y, unit specifier
 *   sRGB  rendering intent
 *   gAMA  gamma * 100000
 *   iCCP  profile name, compression method, compressed profile bytes
 *   IDAT / IEND  known, no fields
 *
 * The embedded ICC profile stays compressed; zebralink does not inflate it.
 * A known chunk with the wrong size keeps its raw data and reports
 * details_valid = false.
 */

#include "zebralink/bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace zebralink {

static constexpr std::size_t PNG_SIGNATURE_SIZE = 8;
static constexpr std::size_t PNG_ICCP_NAME_MAX  = 79;

struct IhdrInfo {
  uint32_t width = 0;
  uint32_t height = 0;
  uint8_t  bit_depth = 0;       // 1, 2, 4, 8, 16
  uint8_t  color_type = 0;      // 0, 2, 3, 4, 6
  uint8_t  compression = 0;
  uint8_t  filter = 0;
  uint8_t  interlace = 0;       // 0 none, 1 Adam7
};

struct PaletteEntry { uint8_t r, g, b; };

struct PlteInfo { std::vector<PaletteEntry> entries; };

struct PhysInfo {
  uint32_t ppu_x = 0;
  uint32_t ppu_y = 0;
  uint8_t  unit = 0;            // 0 unknown, 1 metre
};

struct SrgbInfo { uint8_t rendering_intent = 0; };

struct GamaInfo { uint32_t gamma = 0; };

struct IccpInfo {
  std::string profile_name;
  uint8_t     compression_method = 0;
  Bytes       compressed_profile;
};

using PngChunkDetails =
    std::variant<std::monostate, IhdrInfo, PlteInfo, PhysInfo, SrgbInfo, GamaInfo, IccpInfo>;

struct PngChunk {
  std::string type;
  uint32_t    length = 0;
  Bytes       data;
  uint32_t    crc = 0;             // as stored in the file
  uint32_t    crc_expected = 0;    // computed over type + data
  bool        crc_matched = false;

  bool critical = false;
  bool is_public = false;
  bool reserved_valid = false;
  bool safe_to_copy = false;
  bool recognized = false;         // known type and reserved bit valid

  PngChunkDetails details;
  bool details_valid = false;
};

enum class PngStatus : uint8_t {
  Ok          = 0,
  NotPng      = 1,   // signature mismatch
  Truncated   = 2,   // ran out of bytes inside a chunk
  CrcMismatch = 3,   // at least one chunk failed its CRC
};

const char* png_status_name(PngStatus s);

bool is_png(const uint8_t* data, std::size_t len);
inline bool is_png(const Bytes& b) { return is_png(b.data(), b.size()); }

/// JFIF signature FF D8 FF E0.
bool is_jpeg(const uint8_t* data, std::size_t len);
inline bool is_jpeg(const Bytes& b) { return is_jpeg(b.data(), b.size()); }

/**
 * @brief Walk every chunk after the signature until IEND or end of data.
 * @param out  Cleared, then receives every chunk read (including corrupt ones).
 */
PngStatus parse_png(const uint8_t* data, std::size_t len, std::vector<PngChunk>& out);
inline PngStatus parse_png(const Bytes& b, std::vector<PngChunk>& out) {
  return parse_png(b.data(), b.size(), out);
}

/// First IHDR in @p chunks with valid details, or nullptr.
const IhdrInfo* png_header(const std::vector<PngChunk>& chunks);

} // namespace zebralink
