// ============================================================================
// printer_profile.cpp - implementation for printer_profile.hpp
// ============================================================================

#include "printer_profile.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace zebralink {

fs::path default_config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "zebralink";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : "") / ".config" / "zebralink";
}

fs::path profile_path(const fs::path& config_dir) { return config_dir / "printer.json"; }

std::string profile_to_json(const PrinterProfile& p) {
  json j;
  j["host"] = p.host;
  j["port"] = p.port;
  j["user"] = p.user;
  j["dpi"] = p.dpi;
  j["connect_timeout_ms"] = p.connect_timeout_ms;
  j["keepalive_ms"] = p.keepalive_ms;
  return j.dump(2);
}

// Unsigned field within [0, max]; absent keys are left alone.
template <typename T>
static bool read_unsigned(const json& j, const char* key, T& out, std::string& err) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
    err = std::string("bad_field:") + key;
    return false;
  }
  const uint64_t n = v.get<uint64_t>();
  if (n > std::numeric_limits<T>::max()) {
    err = std::string("bad_field:") + key;
    return false;
  }
  out = static_cast<T>(n);
  return true;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  if (!j.contains(key)) return true;
  if (!j.at(key).is_string()) {
    err = std::string("bad_field:") + key;
    return false;
  }
  out = j.at(key).get<std::string>();
  return true;
}

bool profile_from_json(const std::string& text, PrinterProfile& out, std::string& err) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    err = std::string("parse_failed:") + e.what();
    return false;
  }
  if (!j.is_object()) {
    err = "parse_failed:not an object";
    return false;
  }

  PrinterProfile p = out;
  if (!read_string(j, "host", p.host, err)) return false;
  if (!read_unsigned(j, "port", p.port, err)) return false;
  if (!read_string(j, "user", p.user, err)) return false;
  if (j.contains("dpi")) {
    if (!j.at("dpi").is_number() || j.at("dpi").get<double>() <= 0) {
      err = "bad_field:dpi";
      return false;
    }
    p.dpi = j.at("dpi").get<double>();
  }
  if (!read_unsigned(j, "connect_timeout_ms", p.connect_timeout_ms, err)) return false;
  if (!read_unsigned(j, "keepalive_ms", p.keepalive_ms, err)) return false;

  out = p;
  return true;
}

bool load_profile(const fs::path& file, PrinterProfile& out, std::string& err) {
  std::error_code ec;
  if (!fs::exists(file, ec)) return true;

  std::ifstream in(file);
  if (!in) {
    err = "read_failed:" + file.string();
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return profile_from_json(ss.str(), out, err);
}

// ---------------------------------------------------------------------------
// save_profile()
// --------------
// Write <file>.tmp, then rename over <file> so a crash never leaves a
// half-written profile behind.
// ---------------------------------------------------------------------------
bool save_profile(const fs::path& file, const PrinterProfile& p, std::string& err) {
  std::error_code ec;
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path(), ec);
    if (ec) {
      err = "config_dir_failed:" + ec.message();
      return false;
    }
  }

  fs::path tmp = file;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::trunc);
    if (!o) {
      err = "write_failed:" + tmp.string();
      return false;
    }
    o << profile_to_json(p) << "\n";
    o.flush();
    if (!o) {
      err = "write_failed:" + tmp.string();
      return false;
    }
  }

  fs::rename(tmp, file, ec);
  if (ec) {
    err = "rename_failed:" + ec.message();
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

} // namespace zebralink
