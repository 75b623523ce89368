#include "homestead/pricing.hpp"
#include <algorithm>

namespace homestead {
namespace pricing {

std::set<StockType> purchased_types(const std::vector<Product>& purchases) {
    std::set<StockType> types;
    for (const auto& p : purchases) {
        types.insert(p.type());
    }
    return types;
}

std::map<StockType, std::vector<Product>> group_by_type(const std::vector<Product>& purchases) {
    std::map<StockType, std::vector<Product>> groups;
    for (const auto& p : purchases) {
        groups[p.type()].push_back(p);
    }
    return groups;
}

int32_t quantity_of(const std::vector<Product>& purchases, StockType type) {
    return static_cast<int32_t>(std::count_if(purchases.begin(), purchases.end(),
        [type](const Product& p) { return p.type() == type; }));
}

int64_t base_total(const std::vector<Product>& purchases) {
    int64_t total = 0;
    for (const auto& p : purchases) {
        total += p.base_price();
    }
    return total;
}

int32_t discount_for(const DiscountMap* discounts, StockType type) {
    if (!discounts) return 0;
    auto it = discounts->find(type);
    return it != discounts->end() ? it->second : 0;
}

int64_t apply_discount(int64_t undiscounted_cents, int32_t percent) {
    int64_t scaled = undiscounted_cents * (100 - percent);
    // Integer division truncates toward zero, which is already the ceiling
    // for negative values.
    int64_t result = scaled / 100;
    if (scaled > 0 && scaled % 100 != 0) ++result;
    return result;
}

int64_t subtotal(const std::vector<Product>& purchases, StockType type,
                 const DiscountMap* discounts) {
    int64_t undiscounted = static_cast<int64_t>(quantity_of(purchases, type)) * base_price(type);
    if (!discounts || discounts->find(type) == discounts->end()) {
        return undiscounted;
    }
    return apply_discount(undiscounted, discount_for(discounts, type));
}

int64_t total(const std::vector<Product>& purchases, const DiscountMap* discounts) {
    if (!discounts) return base_total(purchases);

    int64_t total = 0;
    for (StockType type : purchased_types(purchases)) {
        total += subtotal(purchases, type, discounts);
    }
    return total;
}

}  // namespace pricing
}  // namespace homestead
