// ============================================================================
// units.cpp - implementation for units.hpp
// ============================================================================

#include "zebralink/units.hpp"

namespace zebralink {

double to_dots(double value, Unit unit, double dpi) {
  switch (unit) {
    case Unit::Inches: return inches_to_dots(value, dpi);
    case Unit::Pixels: return pixels_to_dots(value, dpi);
    case Unit::Dots:   break;
  }
  return value;
}

double from_dots(double dots, Unit unit, double dpi) {
  switch (unit) {
    case Unit::Inches: return dots_to_inches(dots, dpi);
    case Unit::Pixels: return dots_to_pixels(dots, dpi);
    case Unit::Dots:   break;
  }
  return dots;
}

std::optional<Unit> parse_unit(const std::string& s) {
  if (s == "dots") return Unit::Dots;
  if (s == "in")   return Unit::Inches;
  if (s == "px")   return Unit::Pixels;
  return std::nullopt;
}

const char* unit_name(Unit u) {
  switch (u) {
    case Unit::Dots:   return "dots";
    case Unit::Inches: return "in";
    case Unit::Pixels: return "px";
  }
  return "?";
}

} // namespace zebralink
