#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace buyplan::core {

// Round half up at `decimals` places (2.345 -> 2.35, -2.5 -> -2 at 0 places).
//
// Every externally visible currency figure goes through this at 2 places, CBM at 3,
// ratios (ROI, monthly ROI, freight multiplier) at 4.
double roundTo(double value, int decimals);

inline double roundMoney(double value) { return roundTo(value, 2); }
inline double roundCbm(double value) { return roundTo(value, 3); }
inline double roundRatio(double value) { return roundTo(value, 4); }

// Returns 0 when the denominator is zero or either operand is not finite.
double safeDivide(double numerator, double denominator);

// Parse a spreadsheet-style number: "1,234.50", "£12", "$3", "€4", "15%".
// A percentage above 1 is scaled to a fraction ("15%" -> 0.15); "0.5%" stays 0.5.
// Returns nullopt for empty or non-numeric text.
std::optional<double> cleanNumber(std::string_view text);

// Lowercase + trim.
std::string normalizeText(std::string_view text);

// Lowercase, keep [a-z0-9] only ("Acme Ltd." -> "acmeltd").
std::string normalizeSupplierKey(std::string_view name);

bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace buyplan::core
