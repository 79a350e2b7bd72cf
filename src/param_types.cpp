// ============================================================================
// param_types.cpp - implementation for param_types.hpp
// ============================================================================

#include "zebralink/param_types.hpp"

#include <stdexcept>

namespace zebralink {

static bool is_ascii_alnum(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

static const char* kind_name(ParamValue::Kind k) {
  switch (k) {
    case ParamValue::Kind::Text:    return "string";
    case ParamValue::Kind::Integer: return "number";
    case ParamValue::Kind::Flag:    return "boolean";
    case ParamValue::Kind::Binary:  return "binary";
  }
  return "?";
}

// ---- IntegerRange -----------------------------------------------------------

IntegerRange::IntegerRange(int64_t min, int64_t max) : min_(min), max_(max) {
  if (min > max) {
    throw std::invalid_argument("integer range: min " + std::to_string(min) +
                                " is greater than max " + std::to_string(max));
  }
}

std::optional<std::string> IntegerRange::validate(const ParamValue& v) const {
  if (!v.is_integer()) return std::string("should be a number");
  const int64_t n = v.integer();
  if (n < min_ || n > max_) return "should be an " + describe();
  return std::nullopt;
}

std::string IntegerRange::describe() const {
  return "integer between " + std::to_string(min_) + " and " + std::to_string(max_);
}

// ---- AlphanumericText -------------------------------------------------------

AlphanumericText::AlphanumericText(std::optional<std::size_t> min_len,
                                   std::optional<std::size_t> max_len)
    : min_len_(min_len), max_len_(max_len) {
  if (min_len && max_len && *min_len > *max_len) {
    throw std::invalid_argument("alphanumeric: min length " + std::to_string(*min_len) +
                                " is greater than max length " + std::to_string(*max_len));
  }
}

std::optional<std::string> AlphanumericText::validate(const ParamValue& v) const {
  if (!v.is_text()) return std::string("should be a string");
  const std::string& s = v.text();

  bool ok = !s.empty();
  for (char c : s) ok = ok && is_ascii_alnum(c);
  if (min_len_ && s.size() < *min_len_) ok = false;
  if (max_len_ && s.size() > *max_len_) ok = false;

  if (ok) return std::nullopt;
  return "should be " + describe();
}

std::string AlphanumericText::describe() const {
  std::string d = "an alphanumeric string";
  if (min_len_ && max_len_) {
    if (*min_len_ == *max_len_) d += " of length " + std::to_string(*min_len_);
    else d += " with length between " + std::to_string(*min_len_) + " and " + std::to_string(*max_len_);
  } else if (min_len_) {
    d += " with length of at least " + std::to_string(*min_len_);
  } else if (max_len_) {
    d += " with length of at most " + std::to_string(*max_len_);
  }
  return d;
}

// ---- OneOf ------------------------------------------------------------------

OneOf::OneOf(std::vector<std::string> members) : members_(std::move(members)) {
  if (members_.empty()) throw std::invalid_argument("one_of: empty member list");
}

std::optional<std::string> OneOf::validate(const ParamValue& v) const {
  if (v.is_text()) {
    for (const auto& m : members_) if (m == v.text()) return std::nullopt;
  }
  return "should be " + describe();
}

std::string OneOf::describe() const {
  std::string d = "one of ";
  for (std::size_t i = 0; i < members_.size(); ++i) {
    if (i) d += ", ";
    d += members_[i];
  }
  return d;
}

// ---- BooleanTokens ----------------------------------------------------------

BooleanTokens::BooleanTokens(std::string true_token, std::string false_token)
    : t_(std::move(true_token)), f_(std::move(false_token)) {
  if (t_ == f_) throw std::invalid_argument("boolean tokens: true and false tokens are equal");
}

std::optional<std::string> BooleanTokens::validate(const ParamValue& v) const {
  if (v.is_flag()) return std::nullopt;
  return std::string("should be a boolean value");
}

std::string BooleanTokens::describe() const {
  return "boolean (" + t_ + "/" + f_ + ")";
}

// ---- KindOf -----------------------------------------------------------------

KindOf::KindOf(ParamValue::Kind kind) : kind_(kind) {}

std::optional<std::string> KindOf::validate(const ParamValue& v) const {
  if (v.kind() == kind_) return std::nullopt;
  if (kind_ == ParamValue::Kind::Binary) return std::string("should be a byte sequence");
  return std::string("should be of type ") + kind_name(kind_);
}

std::string KindOf::describe() const { return kind_name(kind_); }

// ---- MatchingText -----------------------------------------------------------

MatchingText::MatchingText(const std::string& pattern) : pattern_(pattern) {
  try {
    re_ = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw std::invalid_argument("matching: bad pattern '" + pattern + "': " + e.what());
  }
}

std::optional<std::string> MatchingText::validate(const ParamValue& v) const {
  if (!v.is_text()) return std::string("should be a string");
  if (std::regex_search(v.text(), re_)) return std::nullopt;
  return "should match " + pattern_;
}

std::string MatchingText::describe() const { return "text matching " + pattern_; }

// ---- AnyOf ------------------------------------------------------------------

AnyOf::AnyOf(std::vector<ParamTypePtr> members) : members_(std::move(members)) {
  if (members_.empty()) throw std::invalid_argument("any_of: empty member list");
  for (const auto& m : members_) {
    if (!m) throw std::invalid_argument("any_of: null member type");
  }
}

std::optional<std::string> AnyOf::validate(const ParamValue& v) const {
  std::string joined;
  for (const auto& m : members_) {
    auto err = m->validate(v);
    if (!err) return std::nullopt;
    if (!joined.empty()) joined += ", or ";
    joined += *err;
  }
  return joined;
}

std::string AnyOf::describe() const {
  std::string d;
  for (const auto& m : members_) {
    if (!d.empty()) d += " | ";
    d += m->describe();
  }
  return d;
}

// ---- factories --------------------------------------------------------------

ParamTypePtr integer_between(int64_t min, int64_t max) {
  return std::make_shared<IntegerRange>(min, max);
}

ParamTypePtr alphanumeric(std::optional<std::size_t> min_len, std::optional<std::size_t> max_len) {
  return std::make_shared<AlphanumericText>(min_len, max_len);
}

ParamTypePtr alphanumeric_of_length(std::size_t len) {
  return std::make_shared<AlphanumericText>(len, len);
}

ParamTypePtr one_of(std::initializer_list<const char*> members) {
  return std::make_shared<OneOf>(std::vector<std::string>(members.begin(), members.end()));
}

ParamTypePtr boolean_tokens(const std::string& t, const std::string& f) {
  return std::make_shared<BooleanTokens>(t, f);
}

ParamTypePtr yes_no() { return boolean_tokens("Y", "N"); }

ParamTypePtr binary() { return std::make_shared<KindOf>(ParamValue::Kind::Binary); }
ParamTypePtr text()   { return std::make_shared<KindOf>(ParamValue::Kind::Text); }
ParamTypePtr number() { return std::make_shared<KindOf>(ParamValue::Kind::Integer); }

ParamTypePtr matching(const std::string& ecmascript_regex) {
  return std::make_shared<MatchingText>(ecmascript_regex);
}

ParamTypePtr any_of(std::initializer_list<ParamTypePtr> members) {
  return std::make_shared<AnyOf>(std::vector<ParamTypePtr>(members));
}

} // namespace zebralink
