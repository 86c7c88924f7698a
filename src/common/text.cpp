#include "execbox/common/text.hpp"

#include <iomanip>
#include <sstream>

namespace execbox::common {

std::string seconds_text(const std::chrono::steady_clock::duration elapsed) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(3)
         << std::chrono::duration<double>(elapsed).count();
  return stream.str();
}

std::size_t utf8_safe_prefix(const std::string &text, const std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text.size();
  }
  std::size_t cut = max_bytes;
  // Back up over continuation bytes so the cut lands on a code point boundary.
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return cut;
}

std::string truncate_output(const std::string &text, const std::size_t max_chars,
                            const std::string &marker, bool *truncated) {
  if (text.size() <= max_chars) {
    if (truncated != nullptr) {
      *truncated = false;
    }
    return text;
  }
  if (truncated != nullptr) {
    *truncated = true;
  }
  return text.substr(0, utf8_safe_prefix(text, max_chars)) + marker;
}

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out += "'";
  return out;
}

void BoundedBuffer::append(const std::string &chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (truncated_) {
    return;
  }
  const std::size_t room = limit_ > data_.size() ? limit_ - data_.size() : 0;
  if (chunk.size() <= room) {
    data_ += chunk;
    return;
  }
  data_.append(chunk, 0, utf8_safe_prefix(chunk, room));
  truncated_ = true;
}

std::string BoundedBuffer::str() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_;
}

bool BoundedBuffer::truncated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return truncated_;
}

bool BoundedBuffer::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.empty();
}

std::string BoundedBuffer::render(const std::string &marker) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return truncated_ ? data_ + marker : data_;
}

} // namespace execbox::common
