// ============================================================================
// command_template.cpp - implementation for command_template.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "zebralink/command_template.hpp"

#include <set>
#include <stdexcept>

namespace zebralink {

// ---------------------------------------------------------------------------
// Rendering helpers
// ---------------------------------------------------------------------------

// Text form of one slot. Flags in a BooleanTokens slot render their token.
static std::string value_text(const ParamSpec* spec, const ParamValue& v) {
  if (v.is_flag() && spec) {
    if (auto* b = dynamic_cast<const BooleanTokens*>(spec->type.get())) return b->token(v.flag());
  }
  return v.to_text();
}

static const ParamValue* lookup(const ParamValues& values, const std::string& key) {
  auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// ValidationError
// ---------------------------------------------------------------------------

std::string ValidationError::message() const {
  std::string m = errors_.size() > 1 ? "invalid parameters" : "invalid parameter";
  if (!command_.empty()) m += " for " + command_;
  m += ":";
  bool first = true;
  for (const auto& kv : errors_) {
    m += first ? " " : "; ";
    first = false;
    m += kv.first + " (";
    for (std::size_t i = 0; i < kv.second.size(); ++i) {
      if (i) m += ", ";
      m += kv.second[i];
    }
    m += ")";
  }
  return m;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

CommandTemplate::CommandTemplate(std::string pattern)
    : pattern_(std::move(pattern)), segments_{pattern_} {}

CommandTemplate::CommandTemplate(std::string pattern, std::vector<ParamSpec> params)
    : pattern_(std::move(pattern)), params_(std::move(params)) {
  check_specs();

  // Scan left to right; at each position the longest matching key wins.
  std::set<std::string> seen;
  std::string literal;
  std::size_t i = 0;
  while (i < pattern_.size()) {
    const ParamSpec* best = nullptr;
    for (const auto& p : params_) {
      if (pattern_.compare(i, p.key.size(), p.key) == 0 &&
          (!best || p.key.size() > best->key.size())) {
        best = &p;
      }
    }
    if (best) {
      segments_.push_back(literal);
      segments_.push_back(best->key);
      seen.insert(best->key);
      literal.clear();
      i += best->key.size();
    } else {
      literal.push_back(pattern_[i++]);
    }
  }
  segments_.push_back(literal);

  for (const auto& p : params_) {
    if (!seen.count(p.key)) {
      throw std::invalid_argument("command template " + pattern_ + ": key '" + p.key +
                                  "' does not occur in the pattern");
    }
  }
}

CommandTemplate CommandTemplate::positional(std::string prefix, std::vector<ParamSpec> params) {
  CommandTemplate t;
  t.params_ = std::move(params);
  t.check_specs();

  t.pattern_ = prefix;
  t.segments_.push_back(std::move(prefix));
  for (std::size_t i = 0; i < t.params_.size(); ++i) {
    ParamSpec& p = t.params_[i];
    const bool last = (i + 1 == t.params_.size());
    if (p.delimiter.empty() && !last) p.delimiter = ",";
    t.pattern_ += p.key + p.delimiter;
    t.segments_.push_back(p.key);
    t.segments_.emplace_back();
  }
  return t;
}

void CommandTemplate::check_specs() const {
  std::set<std::string> keys;
  for (const auto& p : params_) {
    if (p.key.empty()) throw std::invalid_argument("command template " + pattern_ + ": empty key");
    if (!p.type) throw std::invalid_argument("command template " + pattern_ + ": key '" + p.key + "' has no type");
    if (!keys.insert(p.key).second) {
      throw std::invalid_argument("command template " + pattern_ + ": duplicate key '" + p.key + "'");
    }
  }
}

const ParamSpec* CommandTemplate::find(const std::string& key) const {
  for (const auto& p : params_) if (p.key == key) return &p;
  return nullptr;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

bool CommandTemplate::validate_params(const ParamValues& values, ValidationError& err) const {
  err.clear();
  err.set_command(pattern_);

  for (const auto& p : params_) {
    const ParamValue* v = lookup(values, p.key);
    if (!v) {
      if (p.required) err.add(p.key, "required parameter is missing");
      continue;
    }
    if (auto e = p.type->validate(*v)) err.add(p.key, *e);
  }
  for (const auto& kv : values) {
    if (!find(kv.first)) err.add(kv.first, "unknown parameter");
  }
  return err.empty();
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string CommandTemplate::render_string(const ParamValues& values) const {
  std::string out;
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i % 2 == 0) { out += segments_[i]; continue; }

    const ParamSpec* spec = find(segments_[i]);
    if (const ParamValue* v = lookup(values, segments_[i])) out += value_text(spec, *v);
    if (spec) out += spec->delimiter;
  }
  return out;
}

Bytes CommandTemplate::render_bytes(const ParamValues& values) const {
  // Pass 1: text for non-binary slots, so the total size is known.
  std::vector<std::string> texts(segments_.size());
  std::vector<const Bytes*> blobs(segments_.size(), nullptr);
  std::size_t total = 0;

  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i % 2 == 0) { total += segments_[i].size(); continue; }

    const ParamSpec* spec = find(segments_[i]);
    if (const ParamValue* v = lookup(values, segments_[i])) {
      if (v->is_binary()) {
        blobs[i] = &v->binary();
        total += blobs[i]->size();
      } else {
        texts[i] = value_text(spec, *v);
      }
    }
    if (spec) texts[i] += spec->delimiter;
    total += texts[i].size();
  }

  // Pass 2: one allocation, then copy.
  Bytes out;
  out.reserve(total);
  for (std::size_t i = 0; i < segments_.size(); ++i) {
    if (i % 2 == 0) {
      out.insert(out.end(), segments_[i].begin(), segments_[i].end());
      continue;
    }
    if (blobs[i]) out.insert(out.end(), blobs[i]->begin(), blobs[i]->end());
    out.insert(out.end(), texts[i].begin(), texts[i].end());
  }
  return out;
}

bool CommandTemplate::try_render_string(const ParamValues& values, std::string& out,
                                        ValidationError& err) const {
  if (!validate_params(values, err)) return false;
  out = render_string(values);
  return true;
}

bool CommandTemplate::try_render_bytes(const ParamValues& values, Bytes& out,
                                       ValidationError& err) const {
  if (!validate_params(values, err)) return false;
  out = render_bytes(values);
  return true;
}

bool CommandTemplate::bind(const std::vector<ParamValue>& ordered, ParamValues& out,
                           ValidationError& err) const {
  err.set_command(pattern_);
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (i >= params_.size()) {
      err.add("#" + std::to_string(i), "unexpected positional value");
      continue;
    }
    out[params_[i].key] = ordered[i];
  }
  return err.empty();
}

} // namespace zebralink
