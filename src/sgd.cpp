// ============================================================================
// sgd.cpp - implementation for sgd.hpp
// ============================================================================

#include "zebralink/sgd.hpp"

namespace zebralink {

const char* sgd_verb_name(SgdVerb v) {
  switch (v) {
    case SgdVerb::Setvar: return "setvar";
    case SgdVerb::Getvar: return "getvar";
    case SgdVerb::Do:     return "do";
  }
  return "getvar";
}

std::optional<SgdVerb> parse_sgd_verb(const std::string& s) {
  if (s == "setvar") return SgdVerb::Setvar;
  if (s == "getvar") return SgdVerb::Getvar;
  if (s == "do")     return SgdVerb::Do;
  return std::nullopt;
}

std::string SgdCommand::to_string() const {
  std::string out = std::string("! U1 ") + sgd_verb_name(verb) + " \"" + attribute + "\"";
  if (verb != SgdVerb::Getvar) out += " \"" + value + "\"";
  out += "\r\n";
  return out;
}

} // namespace zebralink
