#pragma once
/**
 * @file qr_code.hpp
 * @brief QR Code sizing helpers for the ^BQ field.
 *
 * @details
 * The printer picks the QR version itself; zebralink only needs to predict it
 * so a magnification factor can be chosen that keeps the symbol inside a
 * target width. That takes three pieces:
 *
 *   - qr_detect_mode(): smallest data mode that can carry the text
 *     (N numeric, A the 45-character alphanumeric set, B bytes).
 *   - qr_version(): smallest version (1..40) whose capacity for that
 *     mode and error-correction level covers the text.
 *   - qr_pixel_size(): modules per side for a version (21 + 4*(v-1)).
 *
 * qr_field_prefix() builds the "^FD" prefix that tells the printer how the
 * data is encoded: "QA," for automatic mode, "QM,N" / "QM,A" for manual mode
 * and "QM,B0005" (4-digit byte count) for byte mode.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace zebralink {

enum class QrMode : char { Numeric = 'N', Alphanumeric = 'A', Byte = 'B', Kanji = 'K' };
enum class QrLevel : char { L = 'L', M = 'M', Q = 'Q', H = 'H' };

static constexpr int QR_VERSION_MIN = 1;
static constexpr int QR_VERSION_MAX = 40;

struct QrDataMode {
  QrMode      mode;
  std::size_t size;   // characters to encode in that mode
};

/// Modules per side, or 0 when @p version is outside 1..40.
int qr_pixel_size(int version);

/// Data capacity in characters for one version, or 0 when out of range.
uint32_t qr_capacity(QrMode mode, QrLevel level, int version);

/// Smallest version that fits @p size characters; 40 when none does.
int qr_version(QrMode mode, QrLevel level, std::size_t size);

bool is_qr_alphanumeric(char c);
QrDataMode qr_detect_mode(const std::string& text);

/// floor(max_size_dots / pixel size), clamped to 1..10.
int qr_magnification(int max_size_dots, int version);

std::string qr_field_prefix(QrLevel level, bool auto_mode, const QrDataMode& dm);

} // namespace zebralink
