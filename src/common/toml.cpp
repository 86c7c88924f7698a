#include "execbox/common/toml.hpp"

#include <cctype>
#include <charconv>

namespace execbox::common {

namespace {

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

template <typename T> const T *value_as(const TomlDocument &doc, const std::string &key) {
  const TomlValue *value = doc.find(key);
  return value == nullptr ? nullptr : std::get_if<T>(value);
}

} // namespace

// Single pass over the text, one logical line at a time.
class TomlParser {
public:
  explicit TomlParser(const std::string &text) : text_(text) {}

  Result<TomlDocument> run() {
    while (pos_ < text_.size()) {
      ++line_;
      skip_blanks();
      if (at_line_end()) {
        skip_line_end();
        continue;
      }
      const bool ok = peek() == '[' ? parse_table_header() : parse_key_value();
      if (!ok) {
        return Result<TomlDocument>::failure(ErrorKind::Validation,
                                             "line " + std::to_string(line_) + ": " + error_);
      }
      skip_blanks();
      if (!at_line_end()) {
        return Result<TomlDocument>::failure(ErrorKind::Validation,
                                             "line " + std::to_string(line_) +
                                                 ": unexpected text after value");
      }
      skip_line_end();
    }
    return Result<TomlDocument>::success(std::move(doc_));
  }

private:
  [[nodiscard]] char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  void skip_blanks() {
    while (pos_ < text_.size() && (text_[pos_] == ' ' || text_[pos_] == '\t')) {
      ++pos_;
    }
  }

  [[nodiscard]] bool at_line_end() const {
    return pos_ >= text_.size() || text_[pos_] == '\n' || text_[pos_] == '\r' ||
           text_[pos_] == '#';
  }

  // Consumes an optional comment and the newline.
  void skip_line_end() {
    while (pos_ < text_.size() && text_[pos_] != '\n') {
      ++pos_;
    }
    if (pos_ < text_.size()) {
      ++pos_;
    }
  }

  bool fail(std::string message) {
    error_ = std::move(message);
    return false;
  }

  // `a.b.c` with optional blanks around the dots.
  bool parse_dotted_key(std::string &out) {
    out.clear();
    for (;;) {
      skip_blanks();
      const std::size_t start = pos_;
      while (pos_ < text_.size() && is_bare_key_char(text_[pos_])) {
        ++pos_;
      }
      if (pos_ == start) {
        return fail(peek() == '"' || peek() == '\'' ? "quoted keys are not supported"
                                                    : "expected a key");
      }
      out += text_.substr(start, pos_ - start);
      skip_blanks();
      if (peek() != '.') {
        return true;
      }
      out.push_back('.');
      ++pos_;
    }
  }

  bool parse_table_header() {
    ++pos_;
    if (peek() == '[') {
      return fail("arrays of tables are not supported");
    }
    std::string name;
    if (!parse_dotted_key(name)) {
      return false;
    }
    if (peek() != ']') {
      return fail("unterminated table header");
    }
    ++pos_;
    table_ = std::move(name);
    return true;
  }

  bool parse_key_value() {
    std::string key;
    if (!parse_dotted_key(key)) {
      return false;
    }
    if (peek() != '=') {
      return fail("expected '=' after key '" + key + "'");
    }
    ++pos_;
    skip_blanks();

    TomlValue value;
    if (!parse_value(value)) {
      return false;
    }
    const std::string full = table_.empty() ? key : table_ + "." + key;
    if (!doc_.values_.emplace(full, std::move(value)).second) {
      return fail("duplicate key '" + full + "'");
    }
    return true;
  }

  bool parse_value(TomlValue &out) {
    const char ch = peek();
    if (ch == '"' || ch == '\'') {
      std::string text;
      if (!parse_string(text)) {
        return false;
      }
      out = std::move(text);
      return true;
    }
    if (ch == '[') {
      return parse_string_array(out);
    }
    if (text_.compare(pos_, 4, "true") == 0) {
      pos_ += 4;
      out = true;
      return true;
    }
    if (text_.compare(pos_, 5, "false") == 0) {
      pos_ += 5;
      out = false;
      return true;
    }
    return parse_number(out);
  }

  bool parse_string(std::string &out) {
    const char quote = text_[pos_++];
    const bool literal = quote == '\'';
    while (pos_ < text_.size() && text_[pos_] != '\n') {
      const char ch = text_[pos_++];
      if (ch == quote) {
        return true;
      }
      if (literal || ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (pos_ >= text_.size()) {
        break;
      }
      switch (const char esc = text_[pos_++]) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(esc);
        break;
      default:
        return fail(std::string("unsupported escape \\") + esc);
      }
    }
    return fail("unterminated string");
  }

  bool parse_string_array(TomlValue &out) {
    ++pos_;
    std::vector<std::string> items;
    for (;;) {
      skip_blanks();
      if (peek() == ']') {
        ++pos_;
        out = std::move(items);
        return true;
      }
      if (peek() != '"' && peek() != '\'') {
        return fail(at_line_end() ? "unterminated array" : "arrays may only hold strings");
      }
      std::string item;
      if (!parse_string(item)) {
        return false;
      }
      items.push_back(std::move(item));
      skip_blanks();
      if (peek() == ',') {
        ++pos_;
      } else if (peek() != ']') {
        return fail("expected ',' or ']' in array");
      }
    }
  }

  bool parse_number(TomlValue &out) {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && !at_line_end() && text_[pos_] != ' ' && text_[pos_] != '\t') {
      ++pos_;
    }
    std::string digits;
    for (std::size_t i = start; i < pos_; ++i) {
      if (text_[i] != '_') {
        digits.push_back(text_[i]);
      }
    }
    if (!digits.empty() && digits.front() == '+') {
      digits.erase(0, 1);
    }
    if (digits.empty()) {
      return fail("missing value");
    }

    const char *first = digits.data();
    const char *last = first + digits.size();
    if (digits.find_first_of(".eE") == std::string::npos) {
      std::int64_t integer = 0;
      const auto [ptr, ec] = std::from_chars(first, last, integer);
      if (ec == std::errc() && ptr == last) {
        out = integer;
        return true;
      }
    } else {
      double real = 0.0;
      const auto [ptr, ec] = std::from_chars(first, last, real);
      if (ec == std::errc() && ptr == last) {
        out = real;
        return true;
      }
    }
    return fail("invalid value '" + text_.substr(start, pos_ - start) + "'");
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::size_t line_ = 0;
  std::string table_;
  std::string error_;
  TomlDocument doc_;
};

const TomlValue *TomlDocument::find(const std::string &key) const {
  const auto it = values_.find(key);
  return it == values_.end() ? nullptr : &it->second;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = value_as<std::string>(*this, key);
  return value != nullptr ? *value : fallback;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto *value = value_as<bool>(*this, key);
  return value != nullptr ? *value : fallback;
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto *value = value_as<std::int64_t>(*this, key);
  return value != nullptr ? *value : fallback;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  if (const auto *real = value_as<double>(*this, key)) {
    return *real;
  }
  if (const auto *integer = value_as<std::int64_t>(*this, key)) {
    return static_cast<double>(*integer);
  }
  return fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto *value = value_as<std::vector<std::string>>(*this, key);
  return value != nullptr ? *value : fallback;
}

Result<TomlDocument> parse_toml(const std::string &content) { return TomlParser(content).run(); }

} // namespace execbox::common
