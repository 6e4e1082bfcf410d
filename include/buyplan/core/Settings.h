#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace buyplan::core {

// Typed key/value settings with a line-based file format.
//
// File format:
//   # comment
//   plan.bundle.seed_count = 5
//   plan.option.horizon    = "three_months"
//
// Keys that are assigned before they are defined are kept as pending assignments
// and applied when the key is defined. Iteration order is name-sorted.
//
// A Settings instance is an ordinary value: callers own it and hand the derived
// configuration to the engine. There is no process-wide registry.

enum class SettingType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

using SettingValue = std::variant<bool, std::int64_t, double, std::string>;

struct Setting {
  std::string name;
  std::string help;
  SettingType type{SettingType::String};
  SettingValue value{};
  SettingValue defaultValue{};
};

class Settings {
public:
  Settings() = default;

  const Setting* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Idempotent for an identical type; returns false if the key exists with another type.
  bool defineBool(std::string_view name, bool defaultValue, std::string_view help = {});
  bool defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help = {});
  bool defineFloat(std::string_view name, double defaultValue, std::string_view help = {});
  bool defineString(std::string_view name, std::string defaultValue, std::string_view help = {});

  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  // Parse `value` according to the key's declared type.
  bool setFromString(std::string_view name, std::string_view value, std::string* outError = nullptr);
  bool reset(std::string_view name, std::string* outError = nullptr);

  std::vector<const Setting*> list() const;

  static const char* typeName(SettingType t);
  static std::string valueToString(const Setting& s);

  bool loadFile(const std::string& path, std::string* outError = nullptr);
  bool loadText(std::string_view text, std::string* outError = nullptr);
  bool saveFile(const std::string& path, std::string* outError = nullptr) const;

  bool hasPending(std::string_view name) const;
  std::optional<std::string> pendingValue(std::string_view name) const;

private:
  bool defineImpl(std::string_view name, SettingType type, SettingValue def, std::string_view help);

  std::map<std::string, Setting, std::less<>> vars_;
  std::map<std::string, std::string, std::less<>> pending_;
};

} // namespace buyplan::core
