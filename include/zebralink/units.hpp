#pragma once
/**
 * @file units.hpp
 * @brief Length conversions between printer dots, inches and CSS pixels.
 *
 * CSS pixels are fixed at 96 per inch. Conversions are plain arithmetic;
 * rounding to whole dots is left to the caller (Label rounds to nearest).
 */

#include <cstdint>
#include <optional>
#include <string>

namespace zebralink {

enum class Unit : uint8_t { Dots = 0, Inches = 1, Pixels = 2 };

static constexpr double CSS_PIXELS_PER_INCH = 96.0;

inline double inches_to_dots(double inches, double dpi) { return inches * dpi; }
inline double dots_to_inches(double dots, double dpi)   { return dots / dpi; }
inline double pixels_to_dots(double px, double dpi)     { return px * dpi / CSS_PIXELS_PER_INCH; }
inline double dots_to_pixels(double dots, double dpi)   { return dots * CSS_PIXELS_PER_INCH / dpi; }

/// Convert @p value in @p unit to dots. Dots pass through untouched.
double to_dots(double value, Unit unit, double dpi);

/// Convert @p dots back into @p unit.
double from_dots(double dots, Unit unit, double dpi);

/// "dots" | "in" | "px"
std::optional<Unit> parse_unit(const std::string& s);
const char* unit_name(Unit u);

} // namespace zebralink
