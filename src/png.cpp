// ============================================================================
// png.cpp - implementation for png.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "zebralink/png.hpp"
#include "zebralink/crc.hpp"

#include <cstring>

namespace zebralink {

static const uint8_t PNG_SIGNATURE[PNG_SIGNATURE_SIZE] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
static const uint8_t JPEG_SIGNATURE[4] = {0xFF, 0xD8, 0xFF, 0xE0};

static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

// ---------------------------------------------------------------------------
// Per-type decoders. Each returns false when the data has the wrong shape;
// the chunk then keeps its raw data with details_valid = false.
// ---------------------------------------------------------------------------

static bool decode_ihdr(const Bytes& d, PngChunkDetails& out) {
  if (d.size() != 13) return false;
  IhdrInfo h;
  h.width       = read_u32_be(&d[0]);
  h.height      = read_u32_be(&d[4]);
  h.bit_depth   = d[8];
  h.color_type  = d[9];
  h.compression = d[10];
  h.filter      = d[11];
  h.interlace   = d[12];
  out = h;
  return true;
}

static bool decode_plte(const Bytes& d, PngChunkDetails& out) {
  if (d.empty() || d.size() % 3 != 0) return false;
  PlteInfo p;
  p.entries.reserve(d.size() / 3);
  for (std::size_t i = 0; i + 3 <= d.size(); i += 3) p.entries.push_back({d[i], d[i + 1], d[i + 2]});
  out = std::move(p);
  return true;
}

static bool decode_phys(const Bytes& d, PngChunkDetails& out) {
  if (d.size() != 9) return false;
  out = PhysInfo{read_u32_be(&d[0]), read_u32_be(&d[4]), d[8]};
  return true;
}

static bool decode_srgb(const Bytes& d, PngChunkDetails& out) {
  if (d.size() != 1) return false;
  out = SrgbInfo{d[0]};
  return true;
}

static bool decode_gama(const Bytes& d, PngChunkDetails& out) {
  if (d.size() != 4) return false;
  out = GamaInfo{read_u32_be(&d[0])};
  return true;
}

// name (1..79 bytes) NUL method(1) profile(rest)
static bool decode_iccp(const Bytes& d, PngChunkDetails& out) {
  std::size_t nul = 0;
  while (nul < d.size() && d[nul] != 0) ++nul;
  if (nul == 0 || nul > PNG_ICCP_NAME_MAX || nul + 2 > d.size()) return false;

  IccpInfo info;
  info.profile_name       = to_string(d.data(), nul);
  info.compression_method = d[nul + 1];
  info.compressed_profile.assign(d.begin() + static_cast<std::ptrdiff_t>(nul + 2), d.end());
  const bool deflate = (info.compression_method == 0);   // the only method PNG defines
  out = std::move(info);
  return deflate;
}

static bool decode_none(const Bytes&, PngChunkDetails&) { return true; }

using Decoder = bool (*)(const Bytes&, PngChunkDetails&);

static Decoder decoder_for(const std::string& type) {
  if (type == "IHDR") return decode_ihdr;
  if (type == "PLTE") return decode_plte;
  if (type == "IDAT") return decode_none;
  if (type == "IEND") return decode_none;
  if (type == "iCCP") return decode_iccp;
  if (type == "gAMA") return decode_gama;
  if (type == "pHYs") return decode_phys;
  if (type == "sRGB") return decode_srgb;
  return nullptr;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

const char* png_status_name(PngStatus s) {
  switch (s) {
    case PngStatus::Ok:          return "ok";
    case PngStatus::NotPng:      return "not_png";
    case PngStatus::Truncated:   return "truncated";
    case PngStatus::CrcMismatch: return "crc_mismatch";
  }
  return "unknown";
}

bool is_png(const uint8_t* data, std::size_t len) {
  return len >= PNG_SIGNATURE_SIZE && std::memcmp(data, PNG_SIGNATURE, PNG_SIGNATURE_SIZE) == 0;
}

bool is_jpeg(const uint8_t* data, std::size_t len) {
  return len >= sizeof(JPEG_SIGNATURE) && std::memcmp(data, JPEG_SIGNATURE, sizeof(JPEG_SIGNATURE)) == 0;
}

PngStatus parse_png(const uint8_t* data, std::size_t len, std::vector<PngChunk>& out) {
  out.clear();
  if (!is_png(data, len)) return PngStatus::NotPng;

  bool crc_failed = false;
  std::size_t i = PNG_SIGNATURE_SIZE;

  while (i < len) {
    if (len - i < 12) return PngStatus::Truncated;           // length + type + CRC minimum

    const uint32_t length = read_u32_be(data + i);
    const uint8_t* type_and_data = data + i + 4;
    if (len - i - 12 < length) return PngStatus::Truncated;

    PngChunk c;
    c.length = length;
    c.type   = to_string(type_and_data, 4);
    c.data.assign(type_and_data + 4, type_and_data + 4 + length);
    c.crc          = read_u32_be(type_and_data + 4 + length);
    c.crc_expected = crc32(type_and_data, 4 + static_cast<std::size_t>(length));
    c.crc_matched  = (c.crc == c.crc_expected);
    crc_failed = crc_failed || !c.crc_matched;

    c.critical       = is_upper(c.type[0]);
    c.is_public      = is_upper(c.type[1]);
    c.reserved_valid = is_upper(c.type[2]);
    c.safe_to_copy   = !is_upper(c.type[3]);

    const Decoder dec = decoder_for(c.type);
    c.recognized = c.reserved_valid && dec != nullptr;
    if (dec) c.details_valid = dec(c.data, c.details);

    i += 12 + static_cast<std::size_t>(length);
    const bool end = (c.type == "IEND");
    out.push_back(std::move(c));
    if (end) break;
  }

  return crc_failed ? PngStatus::CrcMismatch : PngStatus::Ok;
}

const IhdrInfo* png_header(const std::vector<PngChunk>& chunks) {
  for (const auto& c : chunks) {
    if (c.type == "IHDR" && c.details_valid) {
      if (auto* h = std::get_if<IhdrInfo>(&c.details)) return h;
    }
  }
  return nullptr;
}

} // namespace zebralink
