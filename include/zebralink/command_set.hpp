#pragma once
/**
 * @file command_set.hpp
 * @brief Ordered, append-only list of (template, values) pairs.
 *
 * @details
 * append() validates before storing, so everything inside a CommandSet is
 * known to render. Rendering is pure: it walks the entries in append order,
 * never mutates them, and gives the same output every time.
 *
 * Templates are held by pointer. They must outlive the set; the catalog
 * templates in zpl_commands.hpp live for the whole program.
 */

#include "zebralink/bytes.hpp"
#include "zebralink/command_template.hpp"
#include "zebralink/param_value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace zebralink {

class CommandSet {
public:
  struct Entry {
    const CommandTemplate* tmpl;
    ParamValues            values;
  };

  /**
   * @brief Validate @p values against @p t and store the pair.
   * @param err  Optional; receives the per-key failures.
   * @return false on validation failure (nothing stored).
   */
  bool append(const CommandTemplate& t, ParamValues values = {}, ValidationError* err = nullptr);

  /// Append every entry of @p other (already validated).
  void extend(const CommandSet& other);

  std::string render_string() const;
  Bytes       render_bytes() const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<Entry>& entries() const { return entries_; }

private:
  std::vector<Entry> entries_;
};

} // namespace zebralink
