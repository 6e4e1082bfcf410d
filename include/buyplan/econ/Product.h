#pragma once

#include <string>
#include <vector>

namespace buyplan::econ {

// Physical data for one case. Missing values are 0 and contribute nothing to
// shipment weight or volume.
struct CaseDimensions {
  double lengthCm{0.0};
  double widthCm{0.0};
  double heightCm{0.0};
  double weightKg{0.0};
};

struct Product {
  std::string sku;
  std::string title;

  // Raw supplier name as supplied; supplierKey is its normalized form.
  std::string supplierName;
  std::string supplierKey;

  // Unit economics (BSF = before shipping and freight).
  double supplierPrice{0.0};
  double amazonPrice{0.0};
  double amazonFees{0.0};
  double vatPerUnit{0.0};

  // Market velocity.
  double monthlySales{0.0};
  double sellerCount{1.0};

  // Purchase quantization: every order is a whole number of cases.
  int caseSize{1};
  CaseDimensions dims{};

  // Inbound stock already queued, added to churn weeks.
  double queuedWeeks{0.0};
};

// supplierPrice > 0, monthlySales > 0 and both identities present.
bool isEligible(const Product& p);

// Profit per unit before freight: amazonPrice - fees - vat - supplierPrice.
double profitPerUnitBSF(const Product& p);

// Profit per unit after freight, against a landed unit cost.
double profitPerUnitASF(const Product& p, double landedCostPerUnit);

// Copies of the eligible products with keys normalized, sellerCount >= 1 and
// caseSize >= 1. Order is preserved.
std::vector<Product> eligibleProducts(const std::vector<Product>& products);

} // namespace buyplan::econ
