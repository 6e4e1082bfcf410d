#include "buyplan/core/Settings.h"

#include "buyplan/core/Log.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace buyplan::core {

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

static std::string lowerAscii(std::string_view s) {
  std::string out(s.size(), '\0');
  for (std::size_t i = 0; i < s.size(); ++i) out[i] = (char)std::tolower((unsigned char)s[i]);
  return out;
}

static bool parseBool(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

static bool parseInt(std::string_view s, std::int64_t& out) {
  s = trimView(s);
  if (s.empty()) return false;
  std::int64_t v = 0;
  const auto* end = s.data() + s.size();
  const auto res = std::from_chars(s.data(), end, v, 10);
  if (res.ec != std::errc{} || res.ptr != end) return false;
  out = v;
  return true;
}

static bool parseFloat(std::string_view s, double& out) {
  s = trimView(s);
  if (s.empty()) return false;
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (!end || (std::size_t)(end - tmp.c_str()) != tmp.size()) return false;
  out = v;
  return true;
}

// Strips one layer of matching quotes and resolves \" \\ \n \t.
static std::string unquote(std::string_view s) {
  s = trimView(s);
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == 'n') { out.push_back('\n'); ++i; continue; }
      if (n == 't') { out.push_back('\t'); ++i; continue; }
      if (n == '\\' || n == '"' || n == '\'') { out.push_back(n); ++i; continue; }
    }
    out.push_back(s[i]);
  }
  return out;
}

static std::string quoteIfNeeded(std::string_view s) {
  bool needs = s.empty();
  for (char c : s) {
    if (std::isspace((unsigned char)c) || c == '#' || c == '=' || c == '"' || c == '\\') {
      needs = true;
      break;
    }
  }
  if (!needs) return std::string(s);

  std::string out = "\"";
  for (char c : s) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else if (c == '\t') out += "\\t";
    else out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Converts text into a value of the requested type. Returns false on a parse error.
static bool parseAs(SettingType type, std::string_view text, SettingValue& out) {
  switch (type) {
    case SettingType::Bool: {
      bool b = false;
      if (!parseBool(text, b)) return false;
      out = b;
      return true;
    }
    case SettingType::Int: {
      std::int64_t i = 0;
      if (!parseInt(text, i)) return false;
      out = i;
      return true;
    }
    case SettingType::Float: {
      double d = 0.0;
      if (!parseFloat(text, d)) return false;
      out = d;
      return true;
    }
    case SettingType::String:
      out = unquote(text);
      return true;
  }
  return false;
}

const Setting* Settings::find(std::string_view name) const {
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

bool Settings::defineImpl(std::string_view name, SettingType type, SettingValue def, std::string_view help) {
  auto it = vars_.find(name);
  if (it != vars_.end()) {
    if (it->second.type != type) return false;
    if (!help.empty()) it->second.help = std::string(help);
    it->second.defaultValue = std::move(def);
    return true;
  }

  Setting s;
  s.name = std::string(name);
  s.help = std::string(help);
  s.type = type;
  s.value = def;
  s.defaultValue = std::move(def);

  const auto pit = pending_.find(name);
  if (pit != pending_.end()) {
    SettingValue parsed;
    if (parseAs(type, pit->second, parsed)) {
      s.value = std::move(parsed);
    } else {
      BUYPLAN_LOG_WARN("settings: ignoring unparsable value for '" + s.name + "': " + pit->second);
    }
    pending_.erase(pit);
  }

  vars_.emplace(s.name, std::move(s));
  return true;
}

bool Settings::defineBool(std::string_view name, bool defaultValue, std::string_view help) {
  return defineImpl(name, SettingType::Bool, SettingValue{defaultValue}, help);
}

bool Settings::defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help) {
  return defineImpl(name, SettingType::Int, SettingValue{defaultValue}, help);
}

bool Settings::defineFloat(std::string_view name, double defaultValue, std::string_view help) {
  return defineImpl(name, SettingType::Float, SettingValue{defaultValue}, help);
}

bool Settings::defineString(std::string_view name, std::string defaultValue, std::string_view help) {
  return defineImpl(name, SettingType::String, SettingValue{std::move(defaultValue)}, help);
}

bool Settings::getBool(std::string_view name, bool fallback) const {
  const Setting* s = find(name);
  if (!s) return fallback;
  if (const auto* b = std::get_if<bool>(&s->value)) return *b;
  return fallback;
}

std::int64_t Settings::getInt(std::string_view name, std::int64_t fallback) const {
  const Setting* s = find(name);
  if (!s) return fallback;
  if (const auto* i = std::get_if<std::int64_t>(&s->value)) return *i;
  return fallback;
}

double Settings::getFloat(std::string_view name, double fallback) const {
  const Setting* s = find(name);
  if (!s) return fallback;
  if (const auto* d = std::get_if<double>(&s->value)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(&s->value)) return (double)*i;
  return fallback;
}

std::string Settings::getString(std::string_view name, std::string_view fallback) const {
  const Setting* s = find(name);
  if (!s) return std::string(fallback);
  if (const auto* str = std::get_if<std::string>(&s->value)) return *str;
  return valueToString(*s);
}

bool Settings::setFromString(std::string_view name, std::string_view value, std::string* outError) {
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown setting: " + std::string(name);
    return false;
  }

  SettingValue parsed;
  if (!parseAs(it->second.type, value, parsed)) {
    if (outError) {
      *outError = "Expected " + std::string(typeName(it->second.type)) + " for " + it->second.name +
                  ", got '" + std::string(trimView(value)) + "'";
    }
    return false;
  }
  it->second.value = std::move(parsed);
  return true;
}

bool Settings::reset(std::string_view name, std::string* outError) {
  auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "Unknown setting: " + std::string(name);
    return false;
  }
  it->second.value = it->second.defaultValue;
  return true;
}

std::vector<const Setting*> Settings::list() const {
  std::vector<const Setting*> out;
  out.reserve(vars_.size());
  for (const auto& [k, v] : vars_) out.push_back(&v);
  return out;
}

const char* Settings::typeName(SettingType t) {
  switch (t) {
    case SettingType::Bool:   return "bool";
    case SettingType::Int:    return "int";
    case SettingType::Float:  return "float";
    case SettingType::String: return "string";
  }
  return "?";
}

std::string Settings::valueToString(const Setting& s) {
  return std::visit([](const auto& v) -> std::string {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, bool>) {
      return v ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      return std::to_string(v);
    } else if constexpr (std::is_same_v<T, double>) {
      std::ostringstream oss;
      oss.precision(10);
      oss << v;
      return oss.str();
    } else {
      return v;
    }
  }, s.value);
}

bool Settings::loadText(std::string_view text, std::string* outError) {
  int lineNo = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    const std::string_view raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
    ++lineNo;

    const std::string_view line = trimView(raw);
    if (line.empty() || line.front() == '#') continue;

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      if (outError) *outError = "Line " + std::to_string(lineNo) + ": expected 'key = value'";
      return false;
    }

    const std::string_view key = trimView(line.substr(0, eq));
    const std::string_view val = trimView(line.substr(eq + 1));
    if (key.empty()) {
      if (outError) *outError = "Line " + std::to_string(lineNo) + ": empty key";
      return false;
    }

    if (exists(key)) {
      std::string err;
      if (!setFromString(key, val, &err)) {
        if (outError) *outError = "Line " + std::to_string(lineNo) + ": " + err;
        return false;
      }
    } else {
      pending_[std::string(key)] = std::string(val);
    }
  }
  return true;
}

bool Settings::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (outError) *outError = "Failed to open settings file: " + path;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return loadText(ss.str(), outError);
}

bool Settings::saveFile(const std::string& path, std::string* outError) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (outError) *outError = "Failed to write settings file: " + path;
    return false;
  }

  out << "# buyplan settings\n";
  for (const Setting* s : list()) {
    if (!s->help.empty()) out << "# " << s->help << "\n";
    const std::string v = valueToString(*s);
    out << s->name << " = " << (s->type == SettingType::String ? quoteIfNeeded(v) : v) << "\n";
  }
  return (bool)out;
}

bool Settings::hasPending(std::string_view name) const {
  return pending_.find(name) != pending_.end();
}

std::optional<std::string> Settings::pendingValue(std::string_view name) const {
  const auto it = pending_.find(name);
  if (it == pending_.end()) return std::nullopt;
  return it->second;
}

} // namespace buyplan::core
