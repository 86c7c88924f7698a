#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace execbox::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal. `\u` escapes, surrogate pairs included, are
/// emitted as UTF-8; malformed escapes are kept verbatim.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// True when `json` holds a single object, surrounding whitespace aside.
[[nodiscard]] bool json_is_object(const std::string &json);

/// Raw text of the top-level member `field`, or nullopt. Members of nested values are not
/// considered.
[[nodiscard]] std::optional<std::string> json_member(const std::string &json,
                                                     const std::string &field);

/// Empty when the member is absent or not a string.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Empty when the member is absent or not an object.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Returns `fallback` when the field is absent or not a JSON boolean.
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field,
                                 bool fallback = false);

/// Top-level members of an object. String values are decoded, everything else is kept as
/// raw JSON text. Parsing stops at the first malformed member.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Serialize string fields as a JSON object with keys in sorted order.
[[nodiscard]] std::string json_object(const std::map<std::string, std::string> &fields);

} // namespace execbox::common
