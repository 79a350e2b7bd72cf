// ============================================================================
// label.cpp - implementation for label.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "zebralink/label.hpp"
#include "zebralink/zpl_commands.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace zebralink {

// QR symbols carry an implicit quiet zone above them; shift the origin up so
// the printed modules land at the requested y.
static constexpr int QR_Y_PADDING = 10;

static std::string one_char(char c) { return std::string(1, c); }

Label::Label(LabelOptions opts) : opts_(std::move(opts)) {
  if (opts_.unit != Unit::Dots && (!opts_.dpi || *opts_.dpi <= 0)) {
    throw std::invalid_argument(std::string("label: a positive dpi is required for unit ") +
                                unit_name(opts_.unit));
  }

  ValidationError err;
  int d = 0;
  bool ok = head_.append(zpl::StartFormat, {}, &err);
  if (ok && opts_.width)
    ok = to_dots(*opts_.width, "a", d, &err) && head_.append(zpl::PrintWidth, {{"a", d}}, &err);
  if (ok && opts_.height)
    ok = to_dots(*opts_.height, "y", d, &err) && head_.append(zpl::LabelLength, {{"y", d}}, &err);
  if (!ok) throw std::invalid_argument("label: " + err.message());
}

bool Label::to_dots(double v, const char* key, int& out, ValidationError* err) const {
  const double d = std::round(zebralink::to_dots(v, opts_.unit, opts_.dpi.value_or(0.0)));
  if (!std::isfinite(d) || d < std::numeric_limits<int>::min() ||
      d > std::numeric_limits<int>::max()) {
    if (err) {
      err->clear();
      err->add(key, "should be a finite number of dots");
    }
    return false;
  }
  out = static_cast<int>(d);
  return true;
}

// ---------------------------------------------------------------------------
// text()
// ------
// ^FO x,y,0 [^FR] (^A font | [^FW r,0]) ^FD text ^FS
// ---------------------------------------------------------------------------
bool Label::text(double x, double y, const std::string& s, const TextOptions& o,
                 ValidationError* err) {
  CommandSet st;
  const std::string orient = one_char(static_cast<char>(o.orientation));
  int xd = 0, yd = 0;
  if (!to_dots(x, "x", xd, err) || !to_dots(y, "y", yd, err)) return false;

  if (!st.append(zpl::FieldOrigin, {{"x", xd}, {"y", yd}, {"z", 0}}, err)) return false;
  if (o.invert && !st.append(zpl::FieldReversePrint, {}, err)) return false;

  bool orientation_changed = false;
  if (o.font) {
    ParamValues fv{{"f", o.font->name}, {"o", orient}};
    if (o.font->width || o.font->height) {
      const double w = o.font->width ? *o.font->width : *o.font->height;
      const double h = o.font->height ? *o.font->height : w;
      int hd = 0, wd = 0;
      if (!to_dots(h, "h", hd, err) || !to_dots(w, "w", wd, err)) return false;
      fv["h"] = hd;
      fv["w"] = wd;
    }
    if (!st.append(zpl::ScalableFont, std::move(fv), err)) return false;
  } else if (last_orientation_ != o.orientation) {
    if (!st.append(zpl::FieldOrientation, {{"r", orient}, {"z", 0}}, err)) return false;
    orientation_changed = true;
  }

  if (!st.append(zpl::FieldData, {{"a", s}}, err)) return false;
  if (!st.append(zpl::FieldSeparator, {}, err)) return false;

  commit(st);
  if (orientation_changed) last_orientation_ = o.orientation;
  return true;
}

// ---------------------------------------------------------------------------
// line()
// ------
// Axis-aligned segments become a ^GB box no thinner than the line; anything
// else becomes ^GD. ^GD leans left ("\") when dx and dy share a sign.
// ---------------------------------------------------------------------------
bool Label::line(double x1, double y1, double x2, double y2, const LineOptions& o,
                 ValidationError* err) {
  CommandSet st;
  const std::string color = one_char(static_cast<char>(o.color));
  int ax = 0, ay = 0, bx = 0, by = 0;
  if (!to_dots(x1, "x1", ax, err) || !to_dots(y1, "y1", ay, err) ||
      !to_dots(x2, "x2", bx, err) || !to_dots(y2, "y2", by, err)) {
    return false;
  }
  const long long dx = static_cast<long long>(bx) - ax;
  const long long dy = static_cast<long long>(by) - ay;

  if (!st.append(zpl::FieldOrigin, {{"x", std::min(ax, bx)}, {"y", std::min(ay, by)}, {"z", 0}}, err)) {
    return false;
  }
  if (o.invert && !st.append(zpl::FieldReversePrint, {}, err)) return false;

  if (dx == 0 || dy == 0) {
    const long long w = std::max(std::abs(dx), static_cast<long long>(o.thickness));
    const long long h = std::max(std::abs(dy), static_cast<long long>(o.thickness));
    if (!st.append(zpl::GraphicBox,
                   {{"w", w}, {"h", h}, {"t", o.thickness}, {"c", color}, {"r", 0}}, err)) {
      return false;
    }
  } else {
    const char dir = ((dx > 0) == (dy > 0)) ? 'L' : 'R';
    if (!st.append(zpl::GraphicDiagonal,
                   {{"w", std::abs(dx)}, {"h", std::abs(dy)}, {"t", o.thickness},
                    {"c", color}, {"o", one_char(dir)}}, err)) {
      return false;
    }
  }

  if (!st.append(zpl::FieldSeparator, {}, err)) return false;
  return commit(st);
}

bool Label::box(double x, double y, double w, double h, const BoxOptions& o, ValidationError* err) {
  CommandSet st;
  int xd = 0, yd = 0, wd = 0, hd = 0;
  if (!to_dots(x, "x", xd, err) || !to_dots(y, "y", yd, err) ||
      !to_dots(w, "w", wd, err) || !to_dots(h, "h", hd, err)) {
    return false;
  }
  const int t = o.filled ? std::min(wd, hd) : o.border_thickness;

  if (!st.append(zpl::FieldOrigin, {{"x", xd}, {"y", yd}, {"z", 0}}, err)) return false;
  if (o.invert && !st.append(zpl::FieldReversePrint, {}, err)) return false;
  if (!st.append(zpl::GraphicBox,
                 {{"w", wd}, {"h", hd}, {"t", t},
                  {"c", one_char(static_cast<char>(o.color))}, {"r", o.corner_rounding}}, err)) {
    return false;
  }
  if (!st.append(zpl::FieldSeparator, {}, err)) return false;
  return commit(st);
}

bool Label::ellipse(double x, double y, double w, double h, const EllipseOptions& o,
                    ValidationError* err) {
  CommandSet st;
  const bool centered = (o.positioning == Positioning::Center);
  const double left = centered ? x - w / 2.0 : x;
  const double top  = centered ? y - h / 2.0 : y;
  int xd = 0, yd = 0, wd = 0, hd = 0;
  if (!to_dots(left, "x", xd, err) || !to_dots(top, "y", yd, err) ||
      !to_dots(w, "w", wd, err) || !to_dots(h, "h", hd, err)) {
    return false;
  }
  const int t = o.filled ? std::min(wd, hd) : o.border_thickness;
  const std::string color = one_char(static_cast<char>(o.color));

  if (!st.append(zpl::FieldOrigin, {{"x", xd}, {"y", yd}, {"z", 0}}, err)) return false;
  if (o.invert && !st.append(zpl::FieldReversePrint, {}, err)) return false;

  if (wd == hd) {
    if (!st.append(zpl::GraphicCircle, {{"d", wd}, {"t", t}, {"c", color}}, err)) return false;
  } else {
    if (!st.append(zpl::GraphicEllipse, {{"w", wd}, {"h", hd}, {"t", t}, {"c", color}}, err)) return false;
  }

  if (!st.append(zpl::FieldSeparator, {}, err)) return false;
  return commit(st);
}

// ---------------------------------------------------------------------------
// qrcode()
// --------
// ^FO x,y-10,0 ^BQ ,2,mag,level,mask ^FD <level><mode prefix><text> ^FS
// Magnification is only derived in manual mode with a target size.
// ---------------------------------------------------------------------------
bool Label::qrcode(double x, double y, const std::string& s, const QrOptions& o,
                   ValidationError* err) {
  CommandSet st;
  const QrDataMode dm = qr_detect_mode(s);

  int xd = 0, yd = 0;
  if (!to_dots(x, "x", xd, err) || !to_dots(y, "y", yd, err)) return false;

  ParamValues bq{{"b", 2}, {"d", one_char(static_cast<char>(o.level))}};
  if (!o.auto_mode && o.max_size) {
    int size = 0;
    if (!to_dots(*o.max_size, "max_size", size, err)) return false;
    bq["c"] = qr_magnification(size, qr_version(dm.mode, o.level, dm.size));
  }
  if (o.mask) bq["e"] = *o.mask;

  const int y_dots = yd < QR_Y_PADDING ? 0 : yd - QR_Y_PADDING;
  if (!st.append(zpl::FieldOrigin, {{"x", xd}, {"y", y_dots}, {"z", 0}}, err)) return false;
  if (!st.append(zpl::QrCode, std::move(bq), err)) return false;
  if (!st.append(zpl::FieldData, {{"a", qr_field_prefix(o.level, o.auto_mode, dm) + s}}, err)) return false;
  if (!st.append(zpl::FieldSeparator, {}, err)) return false;
  return commit(st);
}

bool Label::comment(const std::string& c, ValidationError* err) {
  return body_.append(zpl::Comment, {{"c", c}}, err);
}

bool Label::image(double x, double y, char drive, const std::string& name, const std::string& ext,
                  ValidationError* err) {
  CommandSet st;
  int xd = 0, yd = 0;
  if (!to_dots(x, "x", xd, err) || !to_dots(y, "y", yd, err)) return false;
  if (!st.append(zpl::FieldOrigin, {{"x", xd}, {"y", yd}, {"z", 0}}, err)) return false;
  if (!st.append(zpl::ImageMove, {{"d", one_char(drive)}, {"o", name}, {"x", ext}}, err)) return false;
  if (!st.append(zpl::FieldSeparator, {}, err)) return false;
  return commit(st);
}

bool Label::print_rate(const ParamValue& print, std::optional<ParamValue> slew,
                       std::optional<ParamValue> backfeed, ValidationError* err) {
  ParamValues v{{"p", print}};
  if (slew)     v["s"] = *slew;
  if (backfeed) v["b"] = *backfeed;
  return body_.append(zpl::PrintRate, std::move(v), err);
}

bool Label::print_quantity(int64_t quantity, ValidationError* err) {
  return body_.append(zpl::PrintQuantity, {{"q", static_cast<long long>(quantity)}}, err);
}

bool Label::append(const CommandTemplate& t, ParamValues values, ValidationError* err) {
  return body_.append(t, std::move(values), err);
}

// ---------------------------------------------------------------------------
// Rendering: head, body, then ^XZ.
// ---------------------------------------------------------------------------

std::string Label::render_string() const {
  return head_.render_string() + body_.render_string() + zpl::EndFormat.render_string({});
}

Bytes Label::render_bytes() const {
  const Bytes head = head_.render_bytes();
  const Bytes body = body_.render_bytes();
  const Bytes tail = zpl::EndFormat.render_bytes({});
  return concat({&head, &body, &tail});
}

} // namespace zebralink
