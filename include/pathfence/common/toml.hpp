#pragma once

#include "pathfence/common/result.hpp"
#include <string>
#include <unordered_map>

namespace pathfence::common {

// Scalar value of a "key = value" line, already unquoted.
struct TomlValue {
  enum class Kind { String, Boolean, Bare };

  Kind kind = Kind::Bare;
  std::string text;
  bool flag = false;
};

// Flat view of a TOML file keyed by "section.key". Only the scalars pathfence writes are
// understood: basic and literal strings, booleans, and bare tokens.
struct TomlDocument {
  std::unordered_map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace pathfence::common
