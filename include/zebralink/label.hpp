#pragma once
/**
 * @page zl-label Label Builder
 * @file label.hpp
 * @brief Drawing-level API that turns text, lines, boxes, ellipses and QR codes into ZPL.
 *
 * @details
 * PURPOSE
 * -------
 * Label sits on top of CommandSet. Each drawing call expands into a short
 * sequence of catalog commands (field origin, the primitive, field
 * separator), converting coordinates from the configured unit to printer dots
 * on the way in.
 *
 * UNITS
 * -----
 * LabelOptions::unit selects dots (default), inches or CSS pixels. Inches and
 * pixels need a DPI; constructing a Label without one throws
 * std::invalid_argument. Converted lengths are rounded to the nearest dot.
 * Line and border thickness are always given in dots.
 *
 * STATE
 * -----
 * The builder remembers the orientation of the last ^FW it emitted. Text in
 * the same orientation as the previous text skips the ^FW. A text call with an
 * explicit font carries its orientation inside ^A and leaves that state alone.
 *
 * ATOMICITY
 * ---------
 * A drawing call stages its commands, validates all of them, and only then
 * appends. A coordinate that converts to NaN, infinity or more dots than an
 * int holds fails the call on that coordinate's key. On failure the label is unchanged and the call returns false with
 * the reasons in the optional ValidationError.
 *
 * RENDERING
 * ---------
 *   ^XA [^PWwidth] [^LLheight] <body> ^XZ
 * An empty label in dots renders "^XA^XZ".
 *
 * EXAMPLE
 * -------
 * @code
 *   zebralink::LabelOptions lo;
 *   lo.unit = zebralink::Unit::Inches;
 *   lo.dpi  = 203;
 *   zebralink::Label label(lo);
 *   label.text(0.25, 0.25, "HELLO");
 *   label.qrcode(0.25, 1.0, "https://example.com", {});
 *   std::string zpl = label.render_string();
 * @endcode
 */

#include "zebralink/bytes.hpp"
#include "zebralink/command_set.hpp"
#include "zebralink/qr_code.hpp"
#include "zebralink/units.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace zebralink {

enum class Orientation : char {
  Normal     = 'N',
  TopDown    = 'R',   // rotated 90 degrees clockwise
  UpsideDown = 'I',
  BottomUp   = 'B',
};

enum class LineColor : char { Black = 'B', White = 'W' };

enum class Positioning : uint8_t { Center = 0, TopLeft = 1 };

struct LabelOptions {
  Unit unit = Unit::Dots;
  std::optional<double> dpi;
  std::optional<double> width;    // emitted as ^PW
  std::optional<double> height;   // emitted as ^LL
};

struct TextFont {
  std::string name;               // single alphanumeric printer font id, e.g. "0"
  std::optional<double> width;
  std::optional<double> height;   // defaults to width
};

struct TextOptions {
  Orientation orientation = Orientation::Normal;
  bool invert = false;
  std::optional<TextFont> font;
};

struct LineOptions {
  LineColor color = LineColor::Black;
  bool invert = false;
  int thickness = 1;
};

struct BoxOptions {
  bool filled = false;
  LineColor color = LineColor::Black;
  bool invert = false;
  int border_thickness = 1;
  int corner_rounding = 0;        // 0..8
};

struct EllipseOptions {
  bool filled = false;
  LineColor color = LineColor::Black;
  bool invert = false;
  Positioning positioning = Positioning::Center;
  int border_thickness = 2;       // ^GC/^GE minimum
};

struct QrOptions {
  std::optional<double> max_size; // target width in label units
  bool auto_mode = false;
  QrLevel level = QrLevel::Q;
  std::optional<int> mask;        // 0..7
};

class Label {
public:
  /// @throws std::invalid_argument on a non-dot unit without a positive DPI,
  ///         or a width/height the printer cannot accept.
  explicit Label(LabelOptions opts = {});

  bool text(double x, double y, const std::string& s, const TextOptions& o = {},
            ValidationError* err = nullptr);
  bool line(double x1, double y1, double x2, double y2, const LineOptions& o = {},
            ValidationError* err = nullptr);
  bool box(double x, double y, double w, double h, const BoxOptions& o = {},
           ValidationError* err = nullptr);
  bool ellipse(double x, double y, double w, double h, const EllipseOptions& o = {},
               ValidationError* err = nullptr);
  bool qrcode(double x, double y, const std::string& s, const QrOptions& o = {},
              ValidationError* err = nullptr);

  bool comment(const std::string& c, ValidationError* err = nullptr);

  /// Place a stored image (^IM) with its top-left corner at (x, y).
  bool image(double x, double y, char drive, const std::string& name, const std::string& ext,
             ValidationError* err = nullptr);

  /// ^PR; speeds are integers or the letters A..E.
  bool print_rate(const ParamValue& print, std::optional<ParamValue> slew = std::nullopt,
                  std::optional<ParamValue> backfeed = std::nullopt, ValidationError* err = nullptr);

  bool print_quantity(int64_t quantity, ValidationError* err = nullptr);

  /// Append any catalog command directly.
  bool append(const CommandTemplate& t, ParamValues values = {}, ValidationError* err = nullptr);

  std::string render_string() const;
  Bytes       render_bytes() const;

  const CommandSet& body() const { return body_; }
  std::optional<Orientation> last_orientation() const { return last_orientation_; }
  const LabelOptions& options() const { return opts_; }

private:
  /// Label units to whole dots. Fails with an error on @p key when the result
  /// is not finite or does not fit in an int.
  bool to_dots(double v, const char* key, int& out, ValidationError* err) const;
  bool commit(const CommandSet& staged) { body_.extend(staged); return true; }

  LabelOptions opts_;
  CommandSet   head_;   // ^XA plus page setup, validated at construction
  CommandSet   body_;
  std::optional<Orientation> last_orientation_;
};

} // namespace zebralink
