#pragma once

#include <optional>
#include <string>
#include <unordered_set>

namespace execbox::security {

/// Imports and calls forbidden for one language before any of its code runs.
struct DenyList {
  std::string language;
  std::unordered_set<std::string> imports;
  std::unordered_set<std::string> calls;
  // Reject `obj.__dunder__` reflection.
  bool block_dunder_access = false;

  [[nodiscard]] bool denies_import(const std::string &module) const;
  [[nodiscard]] bool denies_call(const std::string &name) const;
};

enum class ViolationKind { Import, Call, Attribute };

struct Violation {
  ViolationKind kind = ViolationKind::Import;
  std::string symbol;
  std::size_t line = 0;

  [[nodiscard]] std::string message() const;
};

[[nodiscard]] const DenyList &python_denylist();

/// Tokenize Python source and report the first denied import, call or dunder access.
/// Comments and string literals are skipped; f-string replacement fields are scanned.
[[nodiscard]] std::optional<Violation> scan_python_source(const std::string &source,
                                                          const DenyList &deny);

} // namespace execbox::security
