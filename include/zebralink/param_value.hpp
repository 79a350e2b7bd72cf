#pragma once
/**
 * @file param_value.hpp
 * @brief Tagged value passed into a command parameter slot.
 *
 * @details
 * A ZPL parameter is one of four things: text, an integer, a flag, or a raw
 * byte sequence (image or font payloads). ParamValue holds exactly one of
 * them. ParamValues is the per-invocation bag handed to a CommandTemplate; the
 * template only borrows it while validating or rendering.
 *
 * EXAMPLE
 * -------
 * @code
 *   zebralink::ParamValues v{{"x", 10}, {"y", 20}, {"z", 0}};
 *   v["a"] = "HELLO";
 *   v["p"] = true;
 * @endcode
 */

#include "zebralink/bytes.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace zebralink {

class ParamValue {
public:
  enum class Kind : uint8_t { Text = 0, Integer = 1, Flag = 2, Binary = 3 };

  ParamValue() : v_(std::string{}) {}
  ParamValue(std::string s) : v_(std::move(s)) {}
  ParamValue(const char* s) : v_(std::string(s)) {}
  ParamValue(char c) : v_(std::string(1, c)) {}
  ParamValue(int i) : v_(static_cast<int64_t>(i)) {}
  ParamValue(long i) : v_(static_cast<int64_t>(i)) {}
  ParamValue(long long i) : v_(static_cast<int64_t>(i)) {}
  ParamValue(unsigned i) : v_(static_cast<int64_t>(i)) {}
  ParamValue(unsigned long i) : v_(static_cast<int64_t>(i)) {}
  ParamValue(bool b) : v_(b) {}
  ParamValue(Bytes b) : v_(std::move(b)) {}

  Kind kind() const { return static_cast<Kind>(v_.index()); }

  bool is_text()    const { return kind() == Kind::Text; }
  bool is_integer() const { return kind() == Kind::Integer; }
  bool is_flag()    const { return kind() == Kind::Flag; }
  bool is_binary()  const { return kind() == Kind::Binary; }

  // Accessors require the matching kind (std::bad_variant_access otherwise).
  const std::string& text() const { return std::get<std::string>(v_); }
  int64_t integer() const         { return std::get<int64_t>(v_); }
  bool flag() const               { return std::get<bool>(v_); }
  const Bytes& binary() const     { return std::get<Bytes>(v_); }

  /// Plain text form: decimal integers, "true"/"false", bytes as Latin-1.
  std::string to_text() const {
    switch (kind()) {
      case Kind::Text:    return text();
      case Kind::Integer: return std::to_string(integer());
      case Kind::Flag:    return flag() ? "true" : "false";
      case Kind::Binary:  return to_string(binary());
    }
    return {};
  }

  bool operator==(const ParamValue& o) const { return v_ == o.v_; }
  bool operator!=(const ParamValue& o) const { return !(*this == o); }

private:
  // Alternative order matches Kind.
  std::variant<std::string, int64_t, bool, Bytes> v_;
};

using ParamValues = std::map<std::string, ParamValue>;

} // namespace zebralink
