#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace buyplan::core {

// Streaming JSON writer.
//
// The caller is responsible for balanced begin/end calls; the writer only tracks
// comma placement and indentation. Non-finite doubles are written as null;
// finite ones with the fewest digits (15..17) that read back exactly.
//
//   JsonWriter j(std::cout, true);
//   j.beginObject();
//   j.key("budget"); j.value(1000.0);
//   j.endObject();
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = false) : out_(out), pretty_(pretty) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view v);
  void value(const char* v) { value(std::string_view(v ? v : "")); }
  void value(const std::string& v) { value(std::string_view(v)); }
  void value(double v);
  void value(int v) { value((long long)v); }
  void value(long long v);
  void value(unsigned long long v);
  void value(bool v);
  void nullValue();

  // Convenience: key + value.
  template <class T>
  void field(std::string_view k, const T& v) {
    key(k);
    value(v);
  }

  static std::string escape(std::string_view s);

private:
  void beforeValue();
  void newline();

  struct Frame {
    bool array{false};
    bool empty{true};
  };

  std::ostream& out_;
  bool pretty_{false};
  bool afterKey_{false};
  std::vector<Frame> stack_;
};

} // namespace buyplan::core
