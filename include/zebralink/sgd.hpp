#pragma once
/**
 * @file sgd.hpp
 * @brief Zebra Set-Get-Do (SGD) configuration commands.
 *
 * SGD lines look like `! U1 setvar "device.languages" "zpl"` and end with
 * CR LF. Attribute names and values are sent as given; the printer expects
 * them in lower case.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace zebralink {

enum class SgdVerb : uint8_t { Setvar = 0, Getvar = 1, Do = 2 };

const char* sgd_verb_name(SgdVerb v);
std::optional<SgdVerb> parse_sgd_verb(const std::string& s);

struct SgdCommand {
  SgdVerb     verb = SgdVerb::Getvar;
  std::string attribute;
  std::string value;          // ignored for getvar

  /// Full command line including the trailing CR LF.
  std::string to_string() const;
};

} // namespace zebralink
