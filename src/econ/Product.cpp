#include "buyplan/econ/Product.h"

#include "buyplan/core/Numeric.h"

#include <algorithm>
#include <cctype>

namespace buyplan::econ {

bool isEligible(const Product& p) {
  if (p.sku.empty()) return false;
  if (p.supplierKey.empty() && core::normalizeSupplierKey(p.supplierName).empty()) return false;
  return p.supplierPrice > 0.0 && p.monthlySales > 0.0;
}

double profitPerUnitBSF(const Product& p) {
  return p.amazonPrice - p.amazonFees - p.vatPerUnit - p.supplierPrice;
}

double profitPerUnitASF(const Product& p, double landedCostPerUnit) {
  return p.amazonPrice - p.amazonFees - p.vatPerUnit - landedCostPerUnit;
}

std::vector<Product> eligibleProducts(const std::vector<Product>& products) {
  std::vector<Product> out;
  out.reserve(products.size());

  for (const Product& src : products) {
    Product p = src;

    // SKU identities are compared upper-case and trimmed.
    std::string sku = core::normalizeText(p.sku);
    std::transform(sku.begin(), sku.end(), sku.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    p.sku = std::move(sku);

    p.supplierKey = core::normalizeSupplierKey(p.supplierKey.empty() ? p.supplierName : p.supplierKey);
    if (!isEligible(p)) continue;

    p.sellerCount = std::max(1.0, p.sellerCount);
    p.caseSize = std::max(1, p.caseSize);
    out.push_back(std::move(p));
  }
  return out;
}

} // namespace buyplan::econ
