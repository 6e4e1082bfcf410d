#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace buyplan::econ {

struct SupplierTerms {
  std::string supplierKey;
  std::string name;
  std::string country;
  std::string region;
  std::string warehouse;

  // Free-form as supplied ("Sea", "Road", "Air"); matched case-insensitively.
  std::string freightMode;
  // "Box", "Pallet", "CourierCandidate" or empty.
  std::string packagingType;

  double packagingWeightPercent{0.0};

  // Minimum spend (ASF) before a shipment is accepted. 0 = none.
  double moqGBP{0.0};

  bool isUK{false};
};

using SupplierMap = std::map<std::string, SupplierTerms, std::less<>>;

// Whole-word match on the country string, case-insensitive: "UK", "GB", "GBR",
// "United Kingdom", "Great Britain", or one of the home nations.
bool isUkCountry(std::string_view country);

// Normalizes key/isUK and drops entries without a usable name. Later entries
// with the same key replace earlier ones.
SupplierMap buildSupplierMap(const std::vector<SupplierTerms>& suppliers);

// Terms for `supplierKey`, or default terms carrying only the key and the
// fallback display name when the supplier is unknown.
SupplierTerms supplierTermsFor(const SupplierMap& map, std::string_view supplierKey,
                               std::string_view fallbackName = {});

} // namespace buyplan::econ
