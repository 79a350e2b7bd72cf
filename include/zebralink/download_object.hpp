#pragma once
/**
 * @page zl-download Download Objects
 * @file download_object.hpp
 * @brief PNG images and TrueType fonts packaged as printer-resident ~DY objects.
 *
 * @details
 * PURPOSE
 * -------
 * A download object is a named file stored in printer memory (drive R: by
 * default) and referenced later by drawing commands. zebralink produces two
 * kinds:
 *
 *   PngObject    ^XA~DYR:NAME,P,P,<bytes>,,<hex>^XZ   then ^ILR:NAME.PNG
 *   FontObject   ~DYR:NAME,B,T,<bytes>,,<raw>          then ^A@N,h,w,R:NAME.TTF
 *
 * NAMES
 * -----
 * Printer object names are 1..8 alphanumeric characters (held in an
 * etl::string<8>). When no name is given, one is derived from the file stem:
 * upper-cased, non-alphanumerics dropped, first eight characters kept.
 *
 * INTEGRITY
 * ---------
 * PNG data is parsed before it is accepted: the signature must match and
 * every chunk CRC must verify. Image payloads travel hex-encoded; base64 is
 * never used for downloads.
 *
 * ERRORS
 * ------
 * Loaders return false with a stable reason in @p err:
 *   "bad_extension:.png", "not_found:<path>", "read_failed:<path>",
 *   "bad_name:<name>", "png:<status>".
 */

#include "zebralink/bytes.hpp"
#include "zebralink/command_template.hpp"
#include "zebralink/label.hpp"
#include "zebralink/png.hpp"

#include "etl/string.h"

#include <cstddef>
#include <string>
#include <vector>

namespace zebralink {

static constexpr std::size_t OBJECT_NAME_MAX = 8;
static constexpr char DEFAULT_DRIVE = 'R';

using ObjectName = etl::string<OBJECT_NAME_MAX>;

/// 1..8 characters, [A-Za-z0-9] only.
bool is_object_name(const std::string& s);

/// Upper-cased alphanumerics of the file stem, truncated to eight.
std::string derive_object_name(const std::string& path);

/// Read a whole file into @p out; false with "not_found:" / "read_failed:" in @p err.
bool read_file(const std::string& path, Bytes& out, std::string& err);

class PngObject {
public:
  /// Load a .png from disk. @p name may be empty to derive one.
  static bool load(const std::string& path, const std::string& name, PngObject& out, std::string& err);

  /// Wrap PNG bytes already in memory.
  static bool from_bytes(Bytes png, const std::string& name, PngObject& out, std::string& err);

  const ObjectName& name() const { return name_; }
  char drive() const { return drive_; }
  const Bytes& data() const { return data_; }
  const std::vector<PngChunk>& chunks() const { return chunks_; }

  /// ^XA ~DY... ^XZ, ready to send.
  bool download_bytes(Bytes& out, ValidationError& err) const;

  /// ^ILR:NAME.PNG
  bool load_command(std::string& out, ValidationError& err) const;

  /// ^IDR:NAME.PNG
  bool delete_command(std::string& out, ValidationError& err) const;

  /// Place the stored image on @p label at (x, y).
  bool draw(Label& label, double x, double y, ValidationError* err = nullptr) const;

private:
  ObjectName name_;
  char drive_ = DEFAULT_DRIVE;
  Bytes data_;
  std::vector<PngChunk> chunks_;
};

class FontObject {
public:
  enum class Kind : char { TrueType = 'T', TrueTypeExtension = 'E' };

  /// Load a .ttf or .tte from disk. @p name may be empty to derive one.
  static bool load(const std::string& path, const std::string& name, FontObject& out, std::string& err);

  const ObjectName& name() const { return name_; }
  char drive() const { return drive_; }
  Kind kind() const { return kind_; }
  const Bytes& data() const { return data_; }
  const char* extension() const { return kind_ == Kind::TrueType ? "TTF" : "TTE"; }

  /// ^XA ~DY... ^XZ with the raw font bytes (format B).
  bool download_bytes(Bytes& out, ValidationError& err) const;

  /// ^A@o,h,w,R:NAME.TTF (or .TTE)
  bool call_command(int height, int width, char orientation, std::string& out, ValidationError& err) const;

  /// ^IDR:NAME.TTF
  bool delete_command(std::string& out, ValidationError& err) const;

private:
  ObjectName name_;
  char drive_ = DEFAULT_DRIVE;
  Kind kind_ = Kind::TrueType;
  Bytes data_;
};

} // namespace zebralink
