#include "execbox/security/denylist.hpp"

#include <cctype>
#include <vector>

namespace execbox::security {

namespace {

enum class TokenKind { Name, Op };

struct Token {
  TokenKind kind;
  std::string text;
  std::size_t line;
};

bool is_ident_start(const char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
         static_cast<unsigned char>(ch) >= 0x80;
}

bool is_ident_char(const char ch) {
  return is_ident_start(ch) || std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool is_string_prefix(const std::string &word) {
  if (word.empty() || word.size() > 2) {
    return false;
  }
  for (const char ch : word) {
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (lower != 'r' && lower != 'b' && lower != 'u' && lower != 'f') {
      return false;
    }
  }
  return true;
}

bool is_dunder(const std::string &name) {
  return name.size() > 4 && name.compare(0, 2, "__") == 0 &&
         name.compare(name.size() - 2, 2, "__") == 0;
}

class Tokenizer {
public:
  explicit Tokenizer(const std::string &source) : src_(source) {}

  // Produces name/operator tokens. Replacement fields of f-strings are collected into
  // `embedded` for a separate scan.
  std::vector<Token> run(std::vector<std::string> &embedded) {
    std::vector<Token> tokens;
    while (pos_ < src_.size()) {
      const char ch = src_[pos_];
      if (ch == '\n') {
        ++line_;
        ++pos_;
        continue;
      }
      if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '\\') {
        ++pos_;
        continue;
      }
      if (ch == '#') {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
          ++pos_;
        }
        continue;
      }
      if (ch == '"' || ch == '\'') {
        skip_string("", embedded);
        continue;
      }
      if (is_ident_start(ch)) {
        const std::size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
          ++pos_;
        }
        std::string word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
            is_string_prefix(word)) {
          skip_string(word, embedded);
          continue;
        }
        tokens.push_back(Token{TokenKind::Name, std::move(word), line_});
        continue;
      }
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
        while (pos_ < src_.size() &&
               (is_ident_char(src_[pos_]) || src_[pos_] == '.')) {
          ++pos_;
        }
        continue;
      }
      tokens.push_back(Token{TokenKind::Op, std::string(1, ch), line_});
      ++pos_;
    }
    return tokens;
  }

private:
  void skip_string(const std::string &prefix, std::vector<std::string> &embedded) {
    bool formatted = false;
    for (const char ch : prefix) {
      if (ch == 'f' || ch == 'F') {
        formatted = true;
      }
    }

    const char quote = src_[pos_];
    const bool triple = src_.compare(pos_, 3, std::string(3, quote)) == 0;
    pos_ += triple ? 3 : 1;

    std::string field;
    int depth = 0;
    while (pos_ < src_.size()) {
      const char ch = src_[pos_];
      if (ch == '\\') {
        pos_ += 2;
        continue;
      }
      if (ch == '\n') {
        ++line_;
        if (!triple) {
          ++pos_;
          return;
        }
      }
      if (ch == quote && depth == 0) {
        if (!triple) {
          ++pos_;
          return;
        }
        if (src_.compare(pos_, 3, std::string(3, quote)) == 0) {
          pos_ += 3;
          return;
        }
      }
      if (formatted) {
        if (ch == '{') {
          if (depth == 0 && pos_ + 1 < src_.size() && src_[pos_ + 1] == '{') {
            pos_ += 2;
            continue;
          }
          if (depth > 0) {
            field.push_back(ch);
          }
          ++depth;
          ++pos_;
          continue;
        }
        if (ch == '}' && depth > 0) {
          --depth;
          if (depth == 0) {
            embedded.push_back(field);
            field.clear();
          } else {
            field.push_back(ch);
          }
          ++pos_;
          continue;
        }
        if (depth > 0) {
          field.push_back(ch);
        }
      }
      ++pos_;
    }
  }

  const std::string &src_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
};

// Reads `a.b.c` starting at `i`; advances `i` past it. Leading dots (relative imports)
// are skipped.
std::string read_dotted_name(const std::vector<Token> &tokens, std::size_t &i) {
  while (i < tokens.size() && tokens[i].kind == TokenKind::Op && tokens[i].text == ".") {
    ++i;
  }
  std::string name;
  while (i < tokens.size() && tokens[i].kind == TokenKind::Name) {
    name += tokens[i].text;
    ++i;
    if (i + 1 < tokens.size() && tokens[i].kind == TokenKind::Op && tokens[i].text == "." &&
        tokens[i + 1].kind == TokenKind::Name) {
      name += ".";
      ++i;
      continue;
    }
    break;
  }
  return name;
}

std::optional<Violation> check_module(const DenyList &deny, const std::string &dotted,
                                      const std::size_t line) {
  if (dotted.empty()) {
    return std::nullopt;
  }
  const std::string root = dotted.substr(0, dotted.find('.'));
  if (deny.denies_import(root)) {
    return Violation{ViolationKind::Import, root, line};
  }
  if (deny.denies_import(dotted)) {
    return Violation{ViolationKind::Import, dotted, line};
  }
  return std::nullopt;
}

bool is_name(const std::vector<Token> &tokens, const std::size_t i, const char *text) {
  return i < tokens.size() && tokens[i].kind == TokenKind::Name && tokens[i].text == text;
}

bool is_op(const std::vector<Token> &tokens, const std::size_t i, const char *op) {
  return i < tokens.size() && tokens[i].kind == TokenKind::Op && tokens[i].text == op;
}

// `a.b [as x], c [as y]` as it follows `import`; `from . import (...)` adds parentheses.
std::optional<Violation> check_module_list(const std::vector<Token> &tokens, std::size_t j,
                                           const DenyList &deny, const std::size_t line) {
  if (is_op(tokens, j, "(")) {
    ++j;
  }
  for (;;) {
    const std::string module = read_dotted_name(tokens, j);
    if (auto violation = check_module(deny, module, line)) {
      return violation;
    }
    if (is_name(tokens, j, "as")) {
      j += 2;
    }
    if (!is_op(tokens, j, ",")) {
      return std::nullopt;
    }
    ++j;
  }
}

std::optional<Violation> scan_tokens(const std::vector<Token> &tokens, const DenyList &deny) {
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const Token &tok = tokens[i];
    if (tok.kind != TokenKind::Name) {
      continue;
    }
    const bool attribute = i > 0 && is_op(tokens, i - 1, ".");

    if (!attribute && tok.text == "import") {
      if (auto violation = check_module_list(tokens, i + 1, deny, tok.line)) {
        return violation;
      }
      continue;
    }

    if (!attribute && tok.text == "from") {
      std::size_t j = i + 1;
      bool relative = false;
      while (is_op(tokens, j, ".")) {
        relative = true;
        ++j;
      }
      const std::string module = is_name(tokens, j, "import") ? "" : read_dotted_name(tokens, j);
      if (auto violation = check_module(deny, module, tok.line)) {
        return violation;
      }
      if (is_name(tokens, j, "import")) {
        // `from . import x` pulls in modules; `from m import x` only attributes of m.
        if (relative && module.empty()) {
          if (auto violation = check_module_list(tokens, j + 1, deny, tok.line)) {
            return violation;
          }
        }
        i = j;
      }
      continue;
    }

    if (deny.block_dunder_access && is_dunder(tok.text)) {
      const bool definition = i > 0 && tokens[i - 1].kind == TokenKind::Name &&
                              tokens[i - 1].text == "def";
      if (attribute || (!definition && tok.text != "__name__" && !deny.denies_call(tok.text))) {
        return Violation{ViolationKind::Attribute, tok.text, tok.line};
      }
    }

    if (!attribute && is_op(tokens, i + 1, "(") && deny.denies_call(tok.text)) {
      return Violation{ViolationKind::Call, tok.text, tok.line};
    }
  }
  return std::nullopt;
}

std::optional<Violation> scan_recursive(const std::string &source, const DenyList &deny,
                                        const int depth) {
  std::vector<std::string> embedded;
  Tokenizer tokenizer(source);
  const auto tokens = tokenizer.run(embedded);
  if (auto violation = scan_tokens(tokens, deny)) {
    return violation;
  }
  if (depth >= 8) {
    return std::nullopt;
  }
  for (const auto &expr : embedded) {
    if (auto violation = scan_recursive(expr, deny, depth + 1)) {
      return violation;
    }
  }
  return std::nullopt;
}

} // namespace

bool DenyList::denies_import(const std::string &module) const { return imports.contains(module); }

bool DenyList::denies_call(const std::string &name) const { return calls.contains(name); }

std::string Violation::message() const {
  switch (kind) {
  case ViolationKind::Import:
    return "Blocked import detected: " + symbol;
  case ViolationKind::Call:
    return "Blocked call detected: " + symbol;
  case ViolationKind::Attribute:
    return "Blocked attribute access detected: " + symbol;
  }
  return "Blocked symbol detected: " + symbol;
}

const DenyList &python_denylist() {
  static const DenyList deny{
      .language = "python",
      .imports = {"os", "sys", "subprocess", "shutil", "tempfile", "pickle", "marshal",
                  "importlib", "ctypes", "socket", "builtins", "multiprocessing", "threading",
                  "signal", "pty", "io", "inspect", "gc"},
      .calls = {"__import__", "eval", "exec", "compile", "open", "file", "input",
                "raw_input", "reload", "vars", "locals", "globals", "dir", "getattr",
                "setattr", "delattr", "hasattr", "callable", "breakpoint", "memoryview",
                "type", "super", "object", "exit", "quit"},
      .block_dunder_access = true,
  };
  return deny;
}

std::optional<Violation> scan_python_source(const std::string &source, const DenyList &deny) {
  return scan_recursive(source, deny, 0);
}

} // namespace execbox::security
