#pragma once

#include "execbox/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace execbox::common {

using TomlValue = std::variant<std::string, bool, std::int64_t, double, std::vector<std::string>>;

/// A parsed TOML file with every key flattened to `table.key`.
///
/// Covers the subset configuration files use: tables, basic and literal strings, integers,
/// floats, booleans and single-line arrays of strings. Getters return `fallback` when the
/// key is absent or holds a different type; integers are accepted where a float is asked for.
class TomlDocument {
public:
  [[nodiscard]] const TomlValue *find(const std::string &key) const;
  [[nodiscard]] std::size_t size() const { return values_.size(); }

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

private:
  friend class TomlParser;

  std::unordered_map<std::string, TomlValue> values_;
};

/// Errors carry ErrorKind::Validation and name the offending line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace execbox::common
