#include "buyplan/core/Numeric.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace buyplan::core {

double roundTo(double value, int decimals) {
  if (!std::isfinite(value)) return value;
  const double factor = std::pow(10.0, decimals);
  return std::floor(value * factor + 0.5) / factor;
}

double safeDivide(double numerator, double denominator) {
  if (!std::isfinite(numerator) || !std::isfinite(denominator)) return 0.0;
  if (denominator == 0.0) return 0.0;
  return numerator / denominator;
}

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::optional<double> cleanNumber(std::string_view text) {
  text = trimView(text);
  if (text.empty()) return std::nullopt;

  bool percent = false;
  std::string cleaned;
  cleaned.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    const unsigned char c = (unsigned char)text[i];
    if (c == '%') { percent = true; continue; }
    if (c == ',' || c == '$') continue;
    // UTF-8 pound (C2 A3) and euro (E2 82 AC) signs.
    if (c == 0xC2 && i + 1 < text.size() && (unsigned char)text[i + 1] == 0xA3) { ++i; continue; }
    if (c == 0xE2 && i + 2 < text.size() && (unsigned char)text[i + 1] == 0x82 &&
        (unsigned char)text[i + 2] == 0xAC) {
      i += 2;
      continue;
    }
    cleaned.push_back((char)c);
  }

  const std::string_view body = trimView(cleaned);
  if (body.empty()) return std::nullopt;

  const std::string tmp(body);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || end == tmp.c_str() || (std::size_t)(end - tmp.c_str()) != tmp.size()) return std::nullopt;
  if (!std::isfinite(v)) return std::nullopt;

  if (percent && v > 1.0) return v / 100.0;
  return v;
}

std::string normalizeText(std::string_view text) {
  text = trimView(text);
  std::string out(text.size(), '\0');
  for (std::size_t i = 0; i < text.size(); ++i) {
    out[i] = (char)std::tolower((unsigned char)text[i]);
  }
  return out;
}

std::string normalizeSupplierKey(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char ch : name) {
    const unsigned char c = (unsigned char)ch;
    if (c >= 0x80) continue;
    const char l = (char)std::tolower(c);
    if ((l >= 'a' && l <= 'z') || (l >= '0' && l <= '9')) out.push_back(l);
  }
  return out;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  if (needle.size() > haystack.size()) return false;
  for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    bool match = true;
    for (std::size_t j = 0; j < needle.size(); ++j) {
      if (std::tolower((unsigned char)haystack[i + j]) != std::tolower((unsigned char)needle[j])) {
        match = false;
        break;
      }
    }
    if (match) return true;
  }
  return false;
}

} // namespace buyplan::core
