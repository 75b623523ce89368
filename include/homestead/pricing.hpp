#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include "homestead/product.hpp"

namespace homestead {

/// Stock type -> discount percentage. Absent types are not discounted.
using DiscountMap = std::map<StockType, int32_t>;

/**
 * Pure pricing over a list of purchases. Every function takes the purchases
 * it prices; nothing is cached. A null discount map means "no special sale".
 */
namespace pricing {

std::set<StockType> purchased_types(const std::vector<Product>& purchases);

std::map<StockType, std::vector<Product>> group_by_type(const std::vector<Product>& purchases);

int32_t quantity_of(const std::vector<Product>& purchases, StockType type);

/// Sum of base prices, one per unit.
int64_t base_total(const std::vector<Product>& purchases);

/// Configured percentage for `type`, or 0.
int32_t discount_for(const DiscountMap* discounts, StockType type);

/**
 * Apply `percent` off `undiscounted_cents`, rounding any fractional cent up.
 * Exact: ceil(undiscounted * (100 - percent) / 100) in integer arithmetic.
 */
int64_t apply_discount(int64_t undiscounted_cents, int32_t percent);

/**
 * Grouped price of every unit of `type`. When `discounts` configures the
 * type, the group is discounted as a whole before rounding.
 */
int64_t subtotal(const std::vector<Product>& purchases, StockType type,
                 const DiscountMap* discounts);

/**
 * Without discounts this is base_total(); with discounts it is the sum of
 * per-type subtotals.
 */
int64_t total(const std::vector<Product>& purchases, const DiscountMap* discounts);

}  // namespace pricing
}  // namespace homestead
