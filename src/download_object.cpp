// ============================================================================
// download_object.cpp - implementation for download_object.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "zebralink/download_object.hpp"
#include "zebralink/command_set.hpp"
#include "zebralink/encodings.hpp"
#include "zebralink/zpl_commands.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace zebralink {

// -------- helpers --------

static std::string lower_ext(const std::string& path) {
  std::string e = fs::path(path).extension().string();
  for (char& c : e) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return e;
}

// Explicit name when given, otherwise derived from the file stem.
static bool resolve_name(const std::string& path, const std::string& name, ObjectName& out,
                         std::string& err) {
  const std::string n = name.empty() ? derive_object_name(path) : name;
  if (!is_object_name(n)) {
    err = "bad_name:" + n;
    return false;
  }
  out.assign(n.c_str());
  return true;
}

static std::string name_str(const ObjectName& n) { return std::string(n.c_str()); }

bool is_object_name(const std::string& s) {
  if (s.empty() || s.size() > OBJECT_NAME_MAX) return false;
  for (char c : s) {
    if (!std::isalnum(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

std::string derive_object_name(const std::string& path) {
  std::string out;
  for (char c : fs::path(path).stem().string()) {
    if (out.size() == OBJECT_NAME_MAX) break;
    const unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80 && std::isalnum(u)) out.push_back(static_cast<char>(std::toupper(u)));
  }
  return out;
}

bool read_file(const std::string& path, Bytes& out, std::string& err) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    err = "not_found:" + path;
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    err = "read_failed:" + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    err = "read_failed:" + path;
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// PngObject
// ---------------------------------------------------------------------------

bool PngObject::load(const std::string& path, const std::string& name, PngObject& out,
                     std::string& err) {
  if (lower_ext(path) != ".png") {
    err = "bad_extension:.png";
    return false;
  }
  Bytes data;
  if (!read_file(path, data, err)) return false;

  const std::string n = name.empty() ? derive_object_name(path) : name;
  return from_bytes(std::move(data), n, out, err);
}

bool PngObject::from_bytes(Bytes png, const std::string& name, PngObject& out, std::string& err) {
  PngObject obj;
  if (!resolve_name("", name, obj.name_, err)) return false;

  const PngStatus st = parse_png(png, obj.chunks_);
  if (st != PngStatus::Ok) {
    err = std::string("png:") + png_status_name(st);
    return false;
  }
  obj.data_ = std::move(png);
  out = std::move(obj);
  return true;
}

bool PngObject::download_bytes(Bytes& out, ValidationError& err) const {
  CommandSet cs;
  const bool ok =
      cs.append(zpl::StartFormat, {}, &err) &&
      cs.append(zpl::DownloadObject,
                {{"d", std::string(1, drive_)},
                 {"f", name_str(name_)},
                 {"b", "P"},                                  // ASCII hex payload
                 {"x", "P"},                                  // .PNG
                 {"t", data_.size()},
                 {"data", to_bytes(to_hex(data_))}},
                &err) &&
      cs.append(zpl::EndFormat, {}, &err);
  if (!ok) return false;
  out = cs.render_bytes();
  return true;
}

bool PngObject::load_command(std::string& out, ValidationError& err) const {
  return zpl::ImageLoad.try_render_string(
      {{"d", std::string(1, drive_)}, {"o", name_str(name_)}, {"x", "PNG"}}, out, err);
}

bool PngObject::delete_command(std::string& out, ValidationError& err) const {
  return zpl::ObjectDelete.try_render_string(
      {{"d", std::string(1, drive_)}, {"o", name_str(name_)}, {"x", "PNG"}}, out, err);
}

bool PngObject::draw(Label& label, double x, double y, ValidationError* err) const {
  return label.image(x, y, drive_, name_str(name_), "PNG", err);
}

// ---------------------------------------------------------------------------
// FontObject
// ---------------------------------------------------------------------------

bool FontObject::load(const std::string& path, const std::string& name, FontObject& out,
                      std::string& err) {
  const std::string ext = lower_ext(path);
  FontObject obj;
  if (ext == ".ttf") {
    obj.kind_ = Kind::TrueType;
  } else if (ext == ".tte") {
    obj.kind_ = Kind::TrueTypeExtension;
  } else {
    err = "bad_extension:.ttf|.tte";
    return false;
  }
  if (!resolve_name(path, name, obj.name_, err)) return false;
  if (!read_file(path, obj.data_, err)) return false;
  out = std::move(obj);
  return true;
}

bool FontObject::download_bytes(Bytes& out, ValidationError& err) const {
  CommandSet cs;
  const bool ok =
      cs.append(zpl::StartFormat, {}, &err) &&
      cs.append(zpl::DownloadObject,
                {{"d", std::string(1, drive_)},
                 {"f", name_str(name_)},
                 {"b", "B"},                                  // raw binary payload
                 {"x", std::string(1, static_cast<char>(kind_))},
                 {"t", data_.size()},
                 {"data", data_}},
                &err) &&
      cs.append(zpl::EndFormat, {}, &err);
  if (!ok) return false;
  out = cs.render_bytes();
  return true;
}

bool FontObject::call_command(int height, int width, char orientation, std::string& out,
                              ValidationError& err) const {
  return zpl::FontByName.try_render_string(
      {{"o", std::string(1, orientation)},
       {"h", height},
       {"w", width},
       {"d", std::string(1, drive_)},
       {"f", name_str(name_)},
       {"x", extension()}},
      out, err);
}

bool FontObject::delete_command(std::string& out, ValidationError& err) const {
  return zpl::ObjectDelete.try_render_string(
      {{"d", std::string(1, drive_)}, {"o", name_str(name_)}, {"x", extension()}}, out, err);
}

} // namespace zebralink
