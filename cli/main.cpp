/**
 * @file main.cpp
 * @brief zebralink CLI: build ZPL and push it to a Zebra printer over FTP.
 *
 * Responsibilities:
 *  - Parse global connection options and subcommands (CLI11).
 *  - Merge the saved printer profile (XDG config, JSON) with command-line
 *    overrides; flags given on the command line always win.
 *  - Build labels, PNG and font download objects, SGD lines.
 *  - Upload through the blocking FtpClient: connect, STOR, QUIT.
 *  - Inspect PNG files (chunk list, flags, CRC status) as text or JSON.
 *
 * Output:
 *  - Results and failures go to stderr as key=value lines, e.g.
 *    `status=ok reply="226 Transfer complete"` or
 *    `status=error reason=connect_failed detail="..."`.
 *  - --dry-run and inspect write their payload to stdout.
 *  - With --verbose the FTP conversation is traced to stderr:
 *    `[FTP] CMD | STOR 1718000000000.zpl`, `[FTP] RES | > 226 ok`.
 *
 * Exit codes: 0 success, 1 runtime failure (network, printer), 2 usage or
 * input error.
 */

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "ftp_client.hpp"
#include "printer_profile.hpp"
#include "zebralink/download_object.hpp"
#include "zebralink/label.hpp"
#include "zebralink/png.hpp"
#include "zebralink/sgd.hpp"
#include "zebralink/units.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace zebralink;

static constexpr int EXIT_RUNTIME = 1;
static constexpr int EXIT_USAGE   = 2;

// ---------- small utilities ----------

static std::string quoted(const std::string& s) {
  std::ostringstream o;
  o << std::quoted(s);
  return o.str();
}

static int report_error(const std::string& reason, const std::string& detail, int code) {
  std::cerr << "status=error reason=" << reason;
  if (!detail.empty()) std::cerr << " detail=" << quoted(detail);
  std::cerr << "\n";
  return code;
}

static std::string hex32(uint32_t v) {
  std::ostringstream o;
  o << std::hex << std::setw(8) << std::setfill('0') << v;
  return o.str();
}

static const char* log_tag(ftp::LogKind k) {
  switch (k) {
    case ftp::LogKind::Command: return "CMD";
    case ftp::LogKind::Reply:   return "RES";
    case ftp::LogKind::Error:   return "ERR";
    case ftp::LogKind::Info:    return "INF";
  }
  return "???";
}

// ---------- connection ----------

struct Connection {
  PrinterProfile profile;
  bool verbose = false;
};

// Connect, run one upload, QUIT. Reports the outcome on stderr.
static int with_printer(const Connection& c, const std::function<ftp::Outcome(FtpClient&)>& op) {
  FtpClientOptions opts;
  opts.connect_timeout_ms = c.profile.connect_timeout_ms;
  opts.keepalive_ms = c.profile.keepalive_ms;
  if (c.verbose) {
    opts.log = [](ftp::LogKind kind, const std::string& msg) {
      std::cerr << "[FTP] " << log_tag(kind) << " | " << msg << "\n";
    };
  }

  FtpClient client(opts);
  const ftp::Outcome conn = client.connect(c.profile.host, c.profile.port, c.profile.user);
  if (!conn.ok) {
    const char* reason = conn.error.kind == ftp::Error::Kind::Timeout ? "connect_timeout" : "connect_failed";
    return report_error(reason, conn.error.to_string(), EXIT_RUNTIME);
  }

  const ftp::Outcome res = op(client);
  const ftp::Outcome bye = client.disconnect();
  if (!bye.ok && c.verbose) std::cerr << "[FTP] ERR | quit: " << bye.error.to_string() << "\n";

  if (!res.ok) {
    const std::string reason = std::string("upload_") + ftp::error_kind_name(res.error.kind);
    return report_error(reason, res.error.to_string(), EXIT_RUNTIME);
  }
  std::cerr << "status=ok reply=" << quoted(res.reply.to_string()) << "\n";
  return 0;
}

// ---------- inspect ----------

static json chunk_details_json(const PngChunk& c) {
  json d = json::object();
  if (const auto* h = std::get_if<IhdrInfo>(&c.details)) {
    d["width"] = h->width;
    d["height"] = h->height;
    d["bit_depth"] = h->bit_depth;
    d["color_type"] = h->color_type;
    d["compression"] = h->compression;
    d["filter"] = h->filter;
    d["interlace"] = h->interlace;
  } else if (const auto* p = std::get_if<PlteInfo>(&c.details)) {
    json entries = json::array();
    for (const auto& e : p->entries) entries.push_back(json::array({e.r, e.g, e.b}));
    d["entries"] = entries;
  } else if (const auto* ph = std::get_if<PhysInfo>(&c.details)) {
    d["ppu_x"] = ph->ppu_x;
    d["ppu_y"] = ph->ppu_y;
    d["unit"] = ph->unit == 1 ? "metre" : "unknown";
  } else if (const auto* s = std::get_if<SrgbInfo>(&c.details)) {
    d["rendering_intent"] = s->rendering_intent;
  } else if (const auto* g = std::get_if<GamaInfo>(&c.details)) {
    d["gamma"] = g->gamma;
  } else if (const auto* i = std::get_if<IccpInfo>(&c.details)) {
    d["profile_name"] = i->profile_name;
    d["compression_method"] = i->compression_method;
    d["compressed_size"] = i->compressed_profile.size();
  }
  return d;
}

static json chunk_json(const PngChunk& c) {
  json j;
  j["type"] = c.type;
  j["length"] = c.length;
  j["crc"] = hex32(c.crc);
  j["crc_expected"] = hex32(c.crc_expected);
  j["crc_matched"] = c.crc_matched;
  j["critical"] = c.critical;
  j["public"] = c.is_public;
  j["reserved_valid"] = c.reserved_valid;
  j["safe_to_copy"] = c.safe_to_copy;
  j["recognized"] = c.recognized;
  j["details_valid"] = c.details_valid;
  if (c.details_valid) j["details"] = chunk_details_json(c);
  return j;
}

static int cmd_inspect(const std::string& path, const std::string& format) {
  Bytes data;
  std::string err;
  if (!read_file(path, data, err)) return report_error("read_failed", err, EXIT_USAGE);

  std::vector<PngChunk> chunks;
  const PngStatus st = parse_png(data, chunks);

  if (format == "json") {
    json j;
    j["file"] = path;
    j["size"] = data.size();
    j["status"] = png_status_name(st);
    json arr = json::array();
    for (const auto& c : chunks) arr.push_back(chunk_json(c));
    j["chunks"] = arr;
    std::cout << j.dump(2) << "\n";
  } else {
    std::cout << "file=" << path << " size=" << data.size() << " status=" << png_status_name(st) << "\n";
    if (const IhdrInfo* h = png_header(chunks))
      std::cout << "image " << h->width << "x" << h->height << " depth=" << int(h->bit_depth)
                << " color_type=" << int(h->color_type) << "\n";
    for (const auto& c : chunks) {
      std::cout << std::left << std::setw(5) << c.type
                << " len=" << std::setw(8) << c.length
                << " crc=" << hex32(c.crc) << (c.crc_matched ? " ok " : " BAD")
                << " critical=" << c.critical
                << " public=" << c.is_public
                << " safe_to_copy=" << c.safe_to_copy
                << " recognized=" << c.recognized << "\n";
      if (c.details_valid) std::cout << "      " << chunk_details_json(c).dump() << "\n";
    }
  }
  return st == PngStatus::Ok ? 0 : EXIT_RUNTIME;
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"zebralink: ZPL label builder and FTP uploader for Zebra printers"};
  app.require_subcommand(1);

  // Global connection options; unset ones fall back to the saved profile.
  std::string host, user, config_dir;
  uint16_t port = 21;
  uint32_t timeout_ms = 5000, keepalive_ms = 60000;
  bool verbose = false;
  auto* opt_host      = app.add_option("--host", host, "Printer host name or IPv4 address");
  auto* opt_port      = app.add_option("--port", port, "FTP port")->check(CLI::Range(1, 65535));
  auto* opt_user      = app.add_option("--user", user, "FTP user name");
  auto* opt_timeout   = app.add_option("--timeout-ms", timeout_ms, "Connect timeout (ms)");
  auto* opt_keepalive = app.add_option("--keepalive-ms", keepalive_ms, "NOOP keep-alive interval, 0 disables");
  app.add_option("--config-dir", config_dir, "Override config directory");
  app.add_flag("-v,--verbose", verbose, "Trace the FTP conversation to stderr");

  // send
  std::string send_file;
  auto* sub_send = app.add_subcommand("send", "Upload a ZPL (or any) file");
  sub_send->add_option("file", send_file, "File to upload")->required()->check(CLI::ExistingFile);

  // label
  std::string lbl_text, lbl_qr, lbl_unit = "dots", lbl_font, lbl_speed;
  double lbl_x = 20, lbl_y = 20, lbl_dpi = 0, lbl_font_size = 0;
  std::optional<double> lbl_qr_x, lbl_qr_y, lbl_width, lbl_height, lbl_qr_size;
  int lbl_quantity = 0;
  bool lbl_dry_run = false;
  auto* sub_label = app.add_subcommand("label", "Build a label and print it");
  sub_label->add_option("--text", lbl_text, "Field text")->required();
  sub_label->add_option("--x", lbl_x, "Text x")->capture_default_str();
  sub_label->add_option("--y", lbl_y, "Text y")->capture_default_str();
  sub_label->add_option("--qr", lbl_qr, "QR code content");
  sub_label->add_option("--qr-x", lbl_qr_x, "QR x (defaults to text x)");
  sub_label->add_option("--qr-y", lbl_qr_y, "QR y (defaults to 60 dots below the text)");
  sub_label->add_option("--qr-size", lbl_qr_size, "Target QR width");
  sub_label->add_option("--unit", lbl_unit, "Coordinate unit")->check(CLI::IsMember({"dots", "in", "px"}));
  sub_label->add_option("--dpi", lbl_dpi, "Printer resolution (defaults to profile)");
  sub_label->add_option("--width", lbl_width, "Label width (^PW)");
  sub_label->add_option("--height", lbl_height, "Label length (^LL)");
  sub_label->add_option("--font", lbl_font, "Printer font id, e.g. 0");
  sub_label->add_option("--font-size", lbl_font_size, "Font height");
  sub_label->add_option("--speed", lbl_speed, "Print speed (^PR): number or A..E");
  sub_label->add_option("--quantity", lbl_quantity, "Copies (^PQ)")->check(CLI::Range(1, 99999999));
  sub_label->add_flag("--dry-run", lbl_dry_run, "Print the ZPL instead of sending it");

  // upload-png
  std::string png_file, png_name;
  bool png_dry_run = false;
  auto* sub_png = app.add_subcommand("upload-png", "Store a PNG on the printer (~DY)");
  sub_png->add_option("file", png_file, "PNG file")->required()->check(CLI::ExistingFile);
  sub_png->add_option("--name", png_name, "Object name, 1-8 alphanumerics");
  sub_png->add_flag("--dry-run", png_dry_run, "Print the download command instead of sending it");

  // upload-font
  std::string font_file, font_name;
  bool font_dry_run = false;
  auto* sub_font = app.add_subcommand("upload-font", "Store a TrueType font on the printer (~DY)");
  sub_font->add_option("file", font_file, "Font file (.ttf or .tte)")->required()->check(CLI::ExistingFile);
  sub_font->add_option("--name", font_name, "Object name, 1-8 alphanumerics");
  sub_font->add_flag("--dry-run", font_dry_run, "Write the download command to stdout instead of sending it");

  // inspect
  std::string inspect_file, inspect_format = "pretty";
  auto* sub_inspect = app.add_subcommand("inspect", "Dump PNG chunks and CRC status");
  sub_inspect->add_option("file", inspect_file, "PNG file")->required()->check(CLI::ExistingFile);
  sub_inspect->add_option("--format", inspect_format, "Output format: pretty|json")
      ->check(CLI::IsMember({"pretty", "json"}))->capture_default_str();

  // sgd
  std::string sgd_verb, sgd_attr, sgd_value;
  auto* sub_sgd = app.add_subcommand("sgd", "Send a Set-Get-Do command");
  sub_sgd->add_option("verb", sgd_verb, "setvar|getvar|do")->required()
      ->check(CLI::IsMember({"setvar", "getvar", "do"}));
  sub_sgd->add_option("attribute", sgd_attr, "Attribute, e.g. device.languages")->required();
  sub_sgd->add_option("value", sgd_value, "Value for setvar/do");

  // profile
  bool profile_save = false;
  auto* sub_profile = app.add_subcommand("profile", "Show or save the printer profile");
  sub_profile->add_flag("--save", profile_save, "Persist the effective settings");

  CLI11_PARSE(app, argc, argv);

  // inspect needs no printer.
  if (sub_inspect->parsed()) return cmd_inspect(inspect_file, inspect_format);

  // Effective profile: file, then command-line overrides.
  const fs::path dir = config_dir.empty() ? default_config_dir() : fs::path(config_dir);
  const fs::path profile_file = profile_path(dir);
  Connection conn;
  conn.verbose = verbose;
  std::string err;
  if (!load_profile(profile_file, conn.profile, err)) return report_error("profile_invalid", err, EXIT_USAGE);
  if (opt_host->count())      conn.profile.host = host;
  if (opt_port->count())      conn.profile.port = port;
  if (opt_user->count())      conn.profile.user = user;
  if (opt_timeout->count())   conn.profile.connect_timeout_ms = timeout_ms;
  if (opt_keepalive->count()) conn.profile.keepalive_ms = keepalive_ms;

  // -------- profile --------
  if (sub_profile->parsed()) {
    if (profile_save) {
      if (!save_profile(profile_file, conn.profile, err)) return report_error("profile_save_failed", err, EXIT_RUNTIME);
      std::cerr << "status=ok saved=" << quoted(profile_file.string()) << "\n";
    }
    std::cout << profile_to_json(conn.profile) << "\n";
    return 0;
  }

  // -------- send --------
  if (sub_send->parsed()) {
    return with_printer(conn, [&](FtpClient& c) { return c.put_file(send_file); });
  }

  // -------- label --------
  if (sub_label->parsed()) {
    LabelOptions lo;
    lo.unit = parse_unit(lbl_unit).value_or(Unit::Dots);
    lo.dpi = lbl_dpi > 0 ? lbl_dpi : conn.profile.dpi;
    lo.width = lbl_width;
    lo.height = lbl_height;

    std::optional<Label> label;
    try {
      label.emplace(lo);
    } catch (const std::invalid_argument& e) {
      return report_error("bad_label", e.what(), EXIT_USAGE);
    }

    ValidationError verr;
    TextOptions to;
    if (!lbl_font.empty()) {
      TextFont f;
      f.name = lbl_font;
      if (lbl_font_size > 0) f.height = lbl_font_size;
      to.font = f;
    }
    if (!label->text(lbl_x, lbl_y, lbl_text, to, &verr)) return report_error("bad_text", verr.message(), EXIT_USAGE);

    if (!lbl_qr.empty()) {
      QrOptions qo;
      qo.auto_mode = !lbl_qr_size;   // a target size needs manual mode
      qo.max_size = lbl_qr_size;
      const double qx = lbl_qr_x ? *lbl_qr_x : lbl_x;
      const double qy = lbl_qr_y ? *lbl_qr_y : lbl_y + from_dots(60, lo.unit, *lo.dpi);
      if (!label->qrcode(qx, qy, lbl_qr, qo, &verr)) return report_error("bad_qr", verr.message(), EXIT_USAGE);
    }
    if (!lbl_speed.empty()) {
      const bool numeric = lbl_speed.size() <= 9 &&
                           lbl_speed.find_first_not_of("0123456789") == std::string::npos;
      const ParamValue speed = numeric ? ParamValue(std::stoll(lbl_speed)) : ParamValue(lbl_speed);
      if (!label->print_rate(speed, std::nullopt, std::nullopt, &verr))
        return report_error("bad_speed", verr.message(), EXIT_USAGE);
    }
    if (lbl_quantity > 0 && !label->print_quantity(lbl_quantity, &verr))
      return report_error("bad_quantity", verr.message(), EXIT_USAGE);

    const std::string zpl = label->render_string();
    if (lbl_dry_run) {
      std::cout << zpl << "\n";
      return 0;
    }
    return with_printer(conn, [&](FtpClient& c) { return c.put_data(zpl); });
  }

  // -------- upload-png --------
  if (sub_png->parsed()) {
    PngObject png;
    if (!PngObject::load(png_file, png_name, png, err)) return report_error("bad_png", err, EXIT_USAGE);
    Bytes out;
    ValidationError verr;
    if (!png.download_bytes(out, verr)) return report_error("bad_png", verr.message(), EXIT_USAGE);
    if (png_dry_run) {
      std::cout << to_string(out) << "\n";
      return 0;
    }
    std::cerr << "object=" << png.drive() << ":" << png.name().c_str() << ".PNG bytes=" << out.size() << "\n";
    return with_printer(conn, [&](FtpClient& c) { return c.put_data(out); });
  }

  // -------- upload-font --------
  if (sub_font->parsed()) {
    FontObject font;
    if (!FontObject::load(font_file, font_name, font, err)) return report_error("bad_font", err, EXIT_USAGE);
    Bytes out;
    ValidationError verr;
    if (!font.download_bytes(out, verr)) return report_error("bad_font", verr.message(), EXIT_USAGE);
    if (font_dry_run) {
      std::fwrite(out.data(), 1, out.size(), stdout);
      return 0;
    }
    std::cerr << "object=" << font.drive() << ":" << font.name().c_str() << "." << font.extension()
              << " bytes=" << out.size() << "\n";
    return with_printer(conn, [&](FtpClient& c) { return c.put_data(out); });
  }

  // -------- sgd --------
  if (sub_sgd->parsed()) {
    SgdCommand cmd;
    cmd.verb = parse_sgd_verb(sgd_verb).value_or(SgdVerb::Getvar);
    cmd.attribute = sgd_attr;
    cmd.value = sgd_value;
    if (cmd.verb == SgdVerb::Setvar && sgd_value.empty())
      return report_error("missing_value", "setvar needs a value", EXIT_USAGE);
    return with_printer(conn, [&](FtpClient& c) { return c.put_data(cmd.to_string()); });
  }

  return report_error("no_command", "", EXIT_USAGE);
}
