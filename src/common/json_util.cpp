#include "execbox/common/json_util.hpp"

#include <cctype>
#include <functional>

namespace execbox::common {

namespace {

constexpr std::size_t kNpos = std::string::npos;

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// Index one past the closing quote of the string literal opening at `pos`.
std::size_t string_end(const std::string &text, std::size_t pos) {
  for (++pos; pos < text.size(); ++pos) {
    if (text[pos] == '\\') {
      ++pos;
    } else if (text[pos] == '"') {
      return pos + 1;
    }
  }
  return kNpos;
}

// Index one past the value starting at `pos`. Containers are matched by depth; scalars run
// to the next delimiter.
std::size_t value_end(const std::string &text, std::size_t pos) {
  if (pos >= text.size()) {
    return kNpos;
  }
  if (text[pos] == '"') {
    return string_end(text, pos);
  }
  if (text[pos] == '{' || text[pos] == '[') {
    int depth = 0;
    while (pos < text.size()) {
      const char ch = text[pos];
      if (ch == '"') {
        pos = string_end(text, pos);
        if (pos == kNpos) {
          return kNpos;
        }
        continue;
      }
      if (ch == '{' || ch == '[') {
        ++depth;
      } else if ((ch == '}' || ch == ']') && --depth == 0) {
        return pos + 1;
      }
      ++pos;
    }
    return kNpos;
  }
  const std::size_t start = pos;
  while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
    ++pos;
  }
  return pos == start ? kNpos : pos;
}

// Calls `visit(key, raw_value)` for every top-level member until it returns false.
void for_each_member(const std::string &json,
                     const std::function<bool(const std::string &, const std::string &)> &visit) {
  std::size_t pos = skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return;
  }
  pos = skip_ws(json, pos + 1);
  while (pos < json.size() && json[pos] == '"') {
    const std::size_t key_end = string_end(json, pos);
    if (key_end == kNpos) {
      return;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 2));

    pos = skip_ws(json, key_end);
    if (pos >= json.size() || json[pos] != ':') {
      return;
    }
    pos = skip_ws(json, pos + 1);
    const std::size_t end = value_end(json, pos);
    if (end == kNpos || !visit(key, json.substr(pos, end - pos))) {
      return;
    }

    pos = skip_ws(json, end);
    if (pos < json.size() && json[pos] == ',') {
      pos = skip_ws(json, pos + 1);
    }
  }
}

void append_utf8(std::string &out, const unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

// Four hex digits at `pos`, or -1.
long read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return -1;
  }
  long code = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = std::isxdigit(static_cast<unsigned char>(raw[i])) == 0 ? -1
                      : std::isdigit(static_cast<unsigned char>(raw[i])) != 0
                          ? raw[i] - '0'
                          : std::tolower(static_cast<unsigned char>(raw[i])) - 'a' + 10;
    if (digit < 0) {
      return -1;
    }
    code = code * 16 + digit;
  }
  return code;
}

} // namespace

std::string json_escape(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default: {
      const auto byte = static_cast<unsigned char>(ch);
      if (byte < 0x20) {
        escaped += "\\u00";
        escaped.push_back(kHex[byte >> 4]);
        escaped.push_back(kHex[byte & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
    }
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  std::size_t i = 0;
  while (i < raw.size()) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i++]);
      continue;
    }
    const char esc = raw[i + 1];
    i += 2;
    switch (esc) {
    case 'n':
      out.push_back('\n');
      continue;
    case 'r':
      out.push_back('\r');
      continue;
    case 't':
      out.push_back('\t');
      continue;
    case 'b':
      out.push_back('\b');
      continue;
    case 'f':
      out.push_back('\f');
      continue;
    case 'u':
      break;
    default:
      out.push_back(esc);
      continue;
    }

    long code = read_hex4(raw, i);
    if (code < 0) {
      out += "\\u";
      continue;
    }
    i += 4;
    if (code >= 0xD800 && code < 0xDC00 && raw.compare(i, 2, "\\u") == 0) {
      const long low = read_hex4(raw, i + 2);
      if (low >= 0xDC00 && low < 0xE000) {
        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        i += 6;
      }
    }
    append_utf8(out, static_cast<unsigned long>(code));
  }
  return out;
}

bool json_is_object(const std::string &json) {
  const std::size_t start = skip_ws(json, 0);
  if (start >= json.size() || json[start] != '{') {
    return false;
  }
  const std::size_t end = value_end(json, start);
  return end != kNpos && skip_ws(json, end) == json.size();
}

std::optional<std::string> json_member(const std::string &json, const std::string &field) {
  std::optional<std::string> found;
  for_each_member(json, [&](const std::string &key, const std::string &raw) {
    if (key != field) {
      return true;
    }
    found = raw;
    return false;
  });
  return found;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto raw = json_member(json, field);
  if (!raw || raw->size() < 2 || raw->front() != '"') {
    return "";
  }
  return json_unescape(raw->substr(1, raw->size() - 2));
}

std::string json_get_object(const std::string &json, const std::string &field) {
  auto raw = json_member(json, field);
  return raw && raw->front() == '{' ? std::move(*raw) : std::string();
}

bool json_get_bool(const std::string &json, const std::string &field, const bool fallback) {
  const auto raw = json_member(json, field);
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return fallback;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for_each_member(json, [&](const std::string &key, const std::string &raw) {
    result[key] = raw.front() == '"' ? json_unescape(raw.substr(1, raw.size() - 2)) : raw;
    return true;
  });
  return result;
}

std::string json_object(const std::map<std::string, std::string> &fields) {
  std::string out = "{";
  for (const auto &[key, value] : fields) {
    if (out.size() > 1) {
      out.push_back(',');
    }
    out += "\"" + json_escape(key) + "\":\"" + json_escape(value) + "\"";
  }
  out.push_back('}');
  return out;
}

} // namespace execbox::common
