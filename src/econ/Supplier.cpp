#include "buyplan/econ/Supplier.h"

#include "buyplan/core/Numeric.h"

#include <cctype>
#include <string>
#include <vector>

namespace buyplan::econ {

static std::vector<std::string> countryWords(std::string_view country) {
  std::vector<std::string> words;
  std::string cur;
  for (char ch : country) {
    const unsigned char c = (unsigned char)ch;
    if (std::isalnum(c)) {
      cur.push_back((char)std::tolower(c));
    } else if (!cur.empty()) {
      words.push_back(std::move(cur));
      cur.clear();
    }
  }
  if (!cur.empty()) words.push_back(std::move(cur));
  return words;
}

bool isUkCountry(std::string_view country) {
  const std::vector<std::string> words = countryWords(country);
  for (std::size_t i = 0; i < words.size(); ++i) {
    const std::string& w = words[i];
    if (w == "uk" || w == "gb" || w == "gbr" || w == "england" || w == "scotland" || w == "wales") return true;

    if (i + 1 < words.size()) {
      const std::string& next = words[i + 1];
      if ((w == "united" && next == "kingdom") || (w == "great" && next == "britain") ||
          (w == "northern" && next == "ireland")) {
        return true;
      }
    }
  }
  return false;
}

SupplierMap buildSupplierMap(const std::vector<SupplierTerms>& suppliers) {
  SupplierMap map;
  for (const SupplierTerms& s : suppliers) {
    const std::string& source = s.name.empty() ? s.supplierKey : s.name;
    const std::string key = core::normalizeSupplierKey(source);
    if (key.empty()) continue;

    SupplierTerms terms = s;
    terms.supplierKey = key;
    if (terms.name.empty()) terms.name = source;
    terms.isUK = s.isUK || isUkCountry(s.country);
    if (terms.moqGBP < 0.0) terms.moqGBP = 0.0;
    if (terms.packagingWeightPercent < 0.0) terms.packagingWeightPercent = 0.0;
    map[key] = std::move(terms);
  }
  return map;
}

SupplierTerms supplierTermsFor(const SupplierMap& map, std::string_view supplierKey,
                               std::string_view fallbackName) {
  const std::string key = core::normalizeSupplierKey(supplierKey);
  const auto it = map.find(key);
  if (it != map.end()) return it->second;

  SupplierTerms t;
  t.supplierKey = key;
  t.name = std::string(fallbackName);
  return t;
}

} // namespace buyplan::econ
