#pragma once
/**
 * @file printer_profile.hpp
 * @brief Persisted printer connection settings (JSON under XDG config).
 *
 * @details
 * The CLI remembers where the printer lives so every invocation does not
 * need --host/--port/--user/--dpi. The profile is a small JSON object:
 *
 * @code
 *   {
 *     "host": "10.0.0.9",
 *     "port": 21,
 *     "user": "zebra",
 *     "dpi": 203,
 *     "connect_timeout_ms": 5000,
 *     "keepalive_ms": 60000
 *   }
 * @endcode
 *
 * Location: $XDG_CONFIG_HOME/zebralink/printer.json, falling back to
 * ~/.config/zebralink/printer.json. Writes go to a temp file first and are
 * renamed into place. Missing fields keep their defaults, unknown fields are
 * ignored, a field of the wrong type is an error.
 */

#include <cstdint>
#include <filesystem>
#include <string>

namespace zebralink {

struct PrinterProfile {
  std::string host = "127.0.0.1";
  uint16_t    port = 21;
  std::string user;
  double      dpi = 203;
  uint32_t    connect_timeout_ms = 5000;
  uint32_t    keepalive_ms = 60000;
};

std::filesystem::path default_config_dir();
std::filesystem::path profile_path(const std::filesystem::path& config_dir);

std::string profile_to_json(const PrinterProfile& p);
/// Overlay fields present in @p text onto @p out.
bool profile_from_json(const std::string& text, PrinterProfile& out, std::string& err);

/// A missing file leaves @p out untouched and succeeds.
bool load_profile(const std::filesystem::path& file, PrinterProfile& out, std::string& err);
bool save_profile(const std::filesystem::path& file, const PrinterProfile& p, std::string& err);

} // namespace zebralink
