#pragma once
/**
 * @page zl-param-types Parameter Types
 * @file param_types.hpp
 * @brief Validators attached to every parameter slot of a ZPL command.
 *
 * @details
 * PURPOSE
 * -------
 * Each parameter of a command template carries a ParamType. The type answers
 * one question: is this value acceptable for this slot, and if not, why? The
 * answer is a short English fragment ("should be an integer between 0 and
 * 32000") that the template engine collects per key.
 *
 * BUILT-IN TYPES
 * --------------
 *   integer_between(min, max)   integer in [min, max]
 *   alphanumeric(min?, max?)    [A-Za-z0-9] text, optional length bounds
 *   one_of({...})               text equal to one member
 *   boolean_tokens(t, f)        a flag, rendered as t or f (yes_no() = Y/N)
 *   binary()                    raw byte sequence
 *   text()                      any text
 *   number()                    any integer
 *   matching(regex)             text matching an ECMAScript regex
 *   any_of({...})               passes if any member passes
 *
 * ERRORS
 * ------
 * validate() never throws. Factories throw std::invalid_argument for
 * definitions that can never be satisfied (min > max, empty union, bad regex).
 * Those are programming errors surfaced when the catalog is built.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto t = zebralink::integer_between(1, 10);
 *   t->validate(5);        // nullopt
 *   t->validate(11);       // "should be an integer between 1 and 10"
 *   t->validate("5");      // "should be a number"
 * @endcode
 */

#include "zebralink/param_value.hpp"

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace zebralink {

class ParamType {
public:
  virtual ~ParamType() = default;

  /// Returns an error description, or nullopt when @p v is acceptable.
  virtual std::optional<std::string> validate(const ParamValue& v) const = 0;

  /// Short human description used in diagnostics and the CLI.
  virtual std::string describe() const = 0;
};

using ParamTypePtr = std::shared_ptr<const ParamType>;

class IntegerRange : public ParamType {
public:
  IntegerRange(int64_t min, int64_t max);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
  int64_t min() const { return min_; }
  int64_t max() const { return max_; }
private:
  int64_t min_;
  int64_t max_;
};

class AlphanumericText : public ParamType {
public:
  AlphanumericText(std::optional<std::size_t> min_len, std::optional<std::size_t> max_len);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
private:
  std::optional<std::size_t> min_len_;
  std::optional<std::size_t> max_len_;
};

class OneOf : public ParamType {
public:
  explicit OneOf(std::vector<std::string> members);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
  const std::vector<std::string>& members() const { return members_; }
private:
  std::vector<std::string> members_;
};

/// A flag rendered as one of two literal tokens.
class BooleanTokens : public ParamType {
public:
  BooleanTokens(std::string true_token, std::string false_token);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
  const std::string& token(bool b) const { return b ? t_ : f_; }
private:
  std::string t_;
  std::string f_;
};

/// Accepts exactly one ParamValue kind.
class KindOf : public ParamType {
public:
  explicit KindOf(ParamValue::Kind kind);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
private:
  ParamValue::Kind kind_;
};

class MatchingText : public ParamType {
public:
  explicit MatchingText(const std::string& pattern);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
private:
  std::string pattern_;
  std::regex re_;
};

class AnyOf : public ParamType {
public:
  explicit AnyOf(std::vector<ParamTypePtr> members);
  std::optional<std::string> validate(const ParamValue& v) const override;
  std::string describe() const override;
private:
  std::vector<ParamTypePtr> members_;
};

// ---- factories --------------------------------------------------------------

ParamTypePtr integer_between(int64_t min, int64_t max);
ParamTypePtr alphanumeric(std::optional<std::size_t> min_len = std::nullopt,
                          std::optional<std::size_t> max_len = std::nullopt);
ParamTypePtr alphanumeric_of_length(std::size_t len);
ParamTypePtr one_of(std::initializer_list<const char*> members);
ParamTypePtr boolean_tokens(const std::string& t, const std::string& f);
ParamTypePtr yes_no();
ParamTypePtr binary();
ParamTypePtr text();
ParamTypePtr number();
ParamTypePtr matching(const std::string& ecmascript_regex);
ParamTypePtr any_of(std::initializer_list<ParamTypePtr> members);

} // namespace zebralink
