#pragma once
/**
 * @page zl-command-template Command Templates
 * @file command_template.hpp
 * @brief Immutable schema for one ZPL command: pattern, typed parameters, renderers.
 *
 * @details
 * OVERVIEW
 * --------
 * Every ZPL command has a fixed textual shape. "^FOx,y,z" is the field origin
 * command: the literal "^FO", then x, a comma, y, a comma, z. A
 * CommandTemplate captures that shape once, at construction, as an ordered
 * list of segments:
 *
 *     index:   0      1    2    3    4    5    6
 *     segment: "^FO"  x    ","  y    ","  z    ""
 *
 * Even indices are literal text, odd indices are parameter keys, and the list
 * always has an odd length. Rendering walks that list and never re-parses the
 * pattern.
 *
 * KEYED VS POSITIONAL
 * -------------------
 * Keyed templates (the common case) name each key inside the pattern. While
 * scanning, the longest declared key that matches at the current position
 * wins, so a key like "data" is never split into "d" + "ata".
 *
 * Positional templates are built with CommandTemplate::positional(prefix,
 * params): the prefix is followed by the parameters in declaration order, each
 * followed by its delimiter (',' by default, nothing after the last one).
 * bind() maps an ordered list of values onto declared keys for either form.
 *
 * VALIDATION
 * ----------
 * validate_params() is exhaustive: every present value is checked, missing
 * required keys and undeclared keys are reported, and all failures end up in
 * one ValidationError keyed by parameter. Nothing is thrown.
 *
 * RENDERING
 * ---------
 *  - render_string(): literals as-is; values as text; unset values render "".
 *    A flag in a BooleanTokens slot renders its token (e.g. "Y").
 *  - render_bytes(): same walk, but byte-sequence values are spliced verbatim.
 *    The output is sized up front and allocated once.
 *  - try_render_*(): validate first; on failure fill the error and leave the
 *    output untouched.
 *
 * CONSTRUCTION ERRORS
 * -------------------
 * Empty or duplicate keys, null types, and keyed templates whose pattern never
 * mentions a declared key throw std::invalid_argument. Catalog templates are
 * built during static initialization, so such mistakes fail at startup.
 *
 * EXAMPLE
 * -------
 * @code
 *   using namespace zebralink;
 *   const CommandTemplate fo("^FOx,y,z", {
 *       {"x", integer_between(0, 32000)},
 *       {"y", integer_between(0, 32000)},
 *       {"z", integer_between(0, 2)},
 *   });
 *   std::string out;
 *   ValidationError err;
 *   if (fo.try_render_string({{"x", 10}, {"y", 20}}, out, err)) {
 *       // out == "^FO10,20,"
 *   }
 * @endcode
 */

#include "zebralink/bytes.hpp"
#include "zebralink/param_types.hpp"
#include "zebralink/param_value.hpp"

#include <map>
#include <string>
#include <vector>

namespace zebralink {

struct ParamSpec {
  std::string  key;
  ParamTypePtr type;
  bool         required = false;
  std::string  delimiter;     // written after the value in rendered output
  std::string  description;
};

/**
 * @brief Per-key collection of validation failures for one command.
 */
class ValidationError {
public:
  ValidationError() = default;
  explicit ValidationError(std::string command) : command_(std::move(command)) {}

  void add(const std::string& key, const std::string& error) { errors_[key].push_back(error); }
  bool empty() const { return errors_.empty(); }
  bool has(const std::string& key) const { return errors_.count(key) != 0; }
  void clear() { errors_.clear(); command_.clear(); }

  const std::string& command() const { return command_; }
  void set_command(const std::string& c) { command_ = c; }

  const std::map<std::string, std::vector<std::string>>& errors() const { return errors_; }

  /// e.g. "invalid parameters for ^FOx,y,z: x (should be a number)"
  std::string message() const;

private:
  std::string command_;
  std::map<std::string, std::vector<std::string>> errors_;
};

class CommandTemplate {
public:
  /// Zero-argument command ("^XA", "^FS").
  explicit CommandTemplate(std::string pattern);

  /// Keyed command: every key must appear in @p pattern.
  CommandTemplate(std::string pattern, std::vector<ParamSpec> params);

  /// Positional command: @p prefix then each parameter and its delimiter.
  static CommandTemplate positional(std::string prefix, std::vector<ParamSpec> params);

  const std::string& pattern() const { return pattern_; }
  const std::vector<std::string>& segments() const { return segments_; }
  const std::vector<ParamSpec>& params() const { return params_; }
  const ParamSpec* find(const std::string& key) const;

  bool validate_params(const ParamValues& values, ValidationError& err) const;

  std::string render_string(const ParamValues& values) const;
  Bytes       render_bytes(const ParamValues& values) const;

  bool try_render_string(const ParamValues& values, std::string& out, ValidationError& err) const;
  bool try_render_bytes(const ParamValues& values, Bytes& out, ValidationError& err) const;

  /**
   * @brief Map ordered values onto keys in declaration order.
   * @return false (and an error under "#<index>") when more values than
   *         declared parameters are given.
   */
  bool bind(const std::vector<ParamValue>& ordered, ParamValues& out, ValidationError& err) const;

private:
  CommandTemplate() = default;
  void check_specs() const;

  std::string pattern_;
  std::vector<std::string> segments_;
  std::vector<ParamSpec> params_;
};

} // namespace zebralink
