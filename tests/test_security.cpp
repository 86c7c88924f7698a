#include "test_framework.hpp"

#include "execbox/security/denylist.hpp"
#include "execbox/security/path_guard.hpp"

#include <string>
#include <vector>

namespace {

namespace sec = execbox::security;

std::string violation_text(const std::string &source) {
  const auto violation = sec::scan_python_source(source, sec::python_denylist());
  return violation.has_value() ? violation->message() : "";
}

} // namespace

void register_security_tests(std::vector<execbox::tests::TestCase> &tests) {
  using execbox::tests::require;
  using execbox::common::ErrorKind;

  tests.push_back({"denylist_blocks_plain_import", [] {
                     require(violation_text("import os") == "Blocked import detected: os",
                             "import os: " + violation_text("import os"));
                   }});

  tests.push_back({"denylist_blocks_every_import_spelling", [] {
                     const std::vector<std::pair<std::string, std::string>> cases = {
                         {"import os.path", "os"},
                         {"import json, subprocess", "subprocess"},
                         {"import socket as s", "socket"},
                         {"from shutil import rmtree", "shutil"},
                         {"from os.path import join", "os"},
                         {"if True:\n    import ctypes\n", "ctypes"},
                         {"x = 1; import pickle", "pickle"},
                         {"from . import os", "os"},
                         {"from .. import json, sys", "sys"},
                         {"from . import (signal as s)", "signal"},
                     };
                     for (const auto &[source, module] : cases) {
                       const auto violation =
                           sec::scan_python_source(source, sec::python_denylist());
                       require(violation.has_value(), "not blocked: " + source);
                       require(violation->kind == sec::ViolationKind::Import,
                               "import kind for: " + source);
                       require(violation->symbol == module,
                               "symbol for " + source + ": " + violation->symbol);
                     }
                   }});

  tests.push_back({"denylist_allows_safe_imports_and_from_names", [] {
                     require(violation_text("import math\nimport json as j") == "",
                             "math and json are allowed");
                     require(violation_text("from collections import os_helpers") == "",
                             "names imported from a safe module are not modules");
                     require(violation_text("from .helpers import os") == "",
                             "names imported from a relative module are attributes");
                     require(violation_text("from . import helpers") == "",
                             "safe relative module");
                   }});

  tests.push_back({"denylist_blocks_calls", [] {
                     require(violation_text("eval('1+1')") == "Blocked call detected: eval",
                             "eval blocked");
                     require(violation_text("x = open ('f')") == "Blocked call detected: open",
                             "open with a space before the paren");
                     require(violation_text("getattr(x, 'y')") == "Blocked call detected: getattr",
                             "getattr blocked");
                   }});

  tests.push_back({"denylist_ignores_strings_and_comments", [] {
                     require(violation_text("print(\"import os\")") == "", "string literal");
                     require(violation_text("# import os\nprint(1)") == "", "comment");
                     require(violation_text("s = '''\nexec(x)\n'''") == "", "triple-quoted");
                     require(violation_text("s = r'eval(1)'") == "", "raw string");
                   }});

  tests.push_back({"denylist_scans_fstring_fields", [] {
                     require(violation_text("print(f\"{eval('2')}\")") ==
                                 "Blocked call detected: eval",
                             "call inside an f-string field");
                     require(violation_text("print(f\"{{eval}}\")") == "",
                             "doubled braces are literal text");
                   }});

  tests.push_back({"denylist_blocks_dunder_reflection", [] {
                     require(violation_text("().__class__.__bases__") ==
                                 "Blocked attribute access detected: __class__",
                             "dunder attribute");
                     require(violation_text("__builtins__") ==
                                 "Blocked attribute access detected: __builtins__",
                             "bare dunder name");
                     require(violation_text("class A:\n    def __init__(self):\n        pass\n") ==
                                 "",
                             "defining a dunder method is allowed");
                     require(violation_text("if __name__ == '__main__':\n    print(1)") == "",
                             "__name__ is allowed");
                   }});

  tests.push_back({"denylist_attribute_calls_are_not_builtin_calls", [] {
                     require(violation_text("obj.eval()") == "", "method named eval");
                   }});

  tests.push_back({"denylist_reports_line", [] {
                     const auto violation =
                         sec::scan_python_source("x = 1\ny = 2\nimport sys\n", sec::python_denylist());
                     require(violation.has_value() && violation->line == 3, "line 3");
                   }});

  tests.push_back({"denylist_is_swappable", [] {
                     sec::DenyList custom{.language = "python",
                                          .imports = {"json"},
                                          .calls = {"print"},
                                          .block_dunder_access = false};
                     require(sec::scan_python_source("import os", custom) == std::nullopt,
                             "os allowed by the custom set");
                     require(sec::scan_python_source("import json", custom).has_value(),
                             "json denied by the custom set");
                     require(sec::scan_python_source("x.__class__", custom) == std::nullopt,
                             "dunder checks disabled");
                   }});

  tests.push_back({"path_guard_resolves_relative_and_absolute", [] {
                     const auto rel = sec::resolve_container_path("/workspace", "out/result.txt");
                     require(rel.ok() && rel.value() == "/workspace/out/result.txt",
                             "relative joined to work dir");
                     const auto dot = sec::resolve_container_path("/workspace/", "./a//b");
                     require(dot.ok() && dot.value() == "/workspace/a/b", "normalized");
                     const auto abs = sec::resolve_container_path("/workspace", "/tmp/x");
                     require(abs.ok() && abs.value() == "/tmp/x", "absolute kept");
                     const auto dots = sec::resolve_container_path("/workspace", "...");
                     require(dots.ok() && dots.value() == "/workspace/...",
                             "three dots is a file name");
                   }});

  tests.push_back({"path_guard_rejects_every_parent_spelling", [] {
                     const std::vector<std::string> spellings = {
                         "..",          "../etc/passwd", "../../etc/passwd", "a/../b",
                         "a/b/..",      "./..",          "/..",             "/workspace/../etc",
                         "/etc/../etc", "a/../../..",    "..//x",           "x/../",
                     };
                     for (const auto &path : spellings) {
                       const auto resolved = sec::resolve_container_path("/workspace", path);
                       require(!resolved.ok(), "accepted traversal: " + path);
                       require(resolved.kind() == ErrorKind::Security, "security kind: " + path);
                       require(resolved.error().find("Path traversal detected") != std::string::npos,
                               "message for " + path);
                     }
                   }});

  tests.push_back({"path_guard_rejects_null_byte", [] {
                     const auto resolved =
                         sec::resolve_container_path("/workspace", std::string("a\0b", 3));
                     require(!resolved.ok() && resolved.kind() == ErrorKind::Security,
                             "null byte rejected");
                   }});

  tests.push_back({"extraction_target_stays_under_root", [] {
                     const auto ok = sec::resolve_extraction_target("/tmp/dest", "dir/file.txt");
                     require(ok.ok() && ok.value() == "/tmp/dest/dir/file.txt", "nested member");
                     const auto slash = sec::resolve_extraction_target("/tmp/dest/", "f");
                     require(slash.ok() && slash.value() == "/tmp/dest/f", "trailing slash root");
                     for (const std::string bad : {"../evil.txt", "a/../../evil", "/etc/passwd", ""}) {
                       require(!sec::resolve_extraction_target("/tmp/dest", bad).ok(),
                               "accepted unsafe member: " + bad);
                     }
                   }});
}
