// ============================================================================
// command_set.cpp - implementation for command_set.hpp
// ============================================================================

#include "zebralink/command_set.hpp"

namespace zebralink {

bool CommandSet::append(const CommandTemplate& t, ParamValues values, ValidationError* err) {
  ValidationError local;
  ValidationError& e = err ? *err : local;
  if (!t.validate_params(values, e)) return false;
  entries_.push_back({&t, std::move(values)});
  return true;
}

void CommandSet::extend(const CommandSet& other) {
  entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
}

std::string CommandSet::render_string() const {
  std::string out;
  for (const auto& e : entries_) out += e.tmpl->render_string(e.values);
  return out;
}

Bytes CommandSet::render_bytes() const {
  std::vector<Bytes> parts;
  parts.reserve(entries_.size());
  std::size_t total = 0;
  for (const auto& e : entries_) {
    parts.push_back(e.tmpl->render_bytes(e.values));
    total += parts.back().size();
  }

  Bytes out;
  out.reserve(total);
  for (const auto& p : parts) out.insert(out.end(), p.begin(), p.end());
  return out;
}

} // namespace zebralink
