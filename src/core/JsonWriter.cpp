#include "buyplan/core/JsonWriter.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace buyplan::core {

std::string JsonWriter::escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char ch : s) {
    const unsigned char c = (unsigned char)ch;
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
          out += buf;
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  return out;
}

void JsonWriter::newline() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) return;

  Frame& f = stack_.back();
  if (!f.empty) out_ << ',';
  f.empty = false;
  newline();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{false, true});
}

void JsonWriter::endObject() {
  const bool wasEmpty = stack_.empty() ? true : stack_.back().empty;
  if (!stack_.empty()) stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << '}';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{true, true});
}

void JsonWriter::endArray() {
  const bool wasEmpty = stack_.empty() ? true : stack_.back().empty;
  if (!stack_.empty()) stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << ']';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  out_ << '"' << escape(k) << "\":";
  if (pretty_) out_ << ' ';
  afterKey_ = true;
}

void JsonWriter::value(std::string_view v) {
  beforeValue();
  out_ << '"' << escape(v) << '"';
}

void JsonWriter::value(double v) {
  beforeValue();
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  // Shortest of 15..17 significant digits that reads back to the same double.
  char buf[64];
  for (int digits = 15; digits <= 17; ++digits) {
    std::snprintf(buf, sizeof(buf), "%.*g", digits, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  out_ << buf;
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(bool v) {
  beforeValue();
  out_ << (v ? "true" : "false");
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

} // namespace buyplan::core
