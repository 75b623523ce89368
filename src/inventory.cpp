#include "homestead/inventory.hpp"
#include "homestead/errors.hpp"
#include "homestead/logging.hpp"
#include <algorithm>

namespace homestead {

// =============================================================================
// BasicInventory
// =============================================================================

void BasicInventory::add(StockType type, Quality quality) {
    products_.emplace_back(type, quality);
}

void BasicInventory::add(StockType type, Quality quality, int quantity) {
    if (quantity != 1) {
        log_warn("inventory", "bulk_add_rejected",
            {{"stock_type", to_string(type)}, {"quantity", quantity}});
        throw InvalidStockRequestError(
            "Current inventory is not fancy enough. Please supply products one at a time.");
    }
    add(type, quality);
}

bool BasicInventory::exists(StockType type) const {
    return std::any_of(products_.begin(), products_.end(),
        [type](const Product& p) { return p.type() == type; });
}

std::vector<Product> BasicInventory::remove(StockType type) {
    for (auto tier = kAllQualities.rbegin(); tier != kAllQualities.rend(); ++tier) {
        auto it = std::find(products_.begin(), products_.end(), Product(type, *tier));
        if (it != products_.end()) {
            Product removed = *it;
            products_.erase(it);
            return {removed};
        }
    }
    return {};
}

std::vector<Product> BasicInventory::remove(StockType type, int quantity) {
    log_warn("inventory", "bulk_remove_rejected",
        {{"stock_type", to_string(type)}, {"quantity", quantity}});
    throw FailedTransactionError(
        "Current inventory is not fancy enough. Please purchase products one at a time.");
}

std::vector<Product> BasicInventory::all_products() const {
    return products_;
}

int BasicInventory::stocked_quantity(StockType type) const {
    return static_cast<int>(std::count_if(products_.begin(), products_.end(),
        [type](const Product& p) { return p.type() == type; }));
}

// =============================================================================
// FancyInventory
// =============================================================================

FancyInventory::FancyInventory() {
    for (auto& tiers : counts_) {
        tiers.fill(0);
    }
}

int& FancyInventory::count(StockType type, Quality quality) {
    return counts_[static_cast<std::size_t>(type)][static_cast<std::size_t>(quality)];
}

int FancyInventory::count(StockType type, Quality quality) const {
    return counts_[static_cast<std::size_t>(type)][static_cast<std::size_t>(quality)];
}

void FancyInventory::add(StockType type, Quality quality) {
    ++count(type, quality);
}

void FancyInventory::add(StockType type, Quality quality, int quantity) {
    for (int i = 0; i < quantity; ++i) {
        add(type, quality);
    }
}

bool FancyInventory::exists(StockType type) const {
    return stocked_quantity(type) > 0;
}

std::vector<Product> FancyInventory::remove(StockType type) {
    for (auto tier = kAllQualities.rbegin(); tier != kAllQualities.rend(); ++tier) {
        int& held = count(type, *tier);
        if (held > 0) {
            --held;
            return {Product(type, *tier)};
        }
    }
    return {};
}

std::vector<Product> FancyInventory::remove(StockType type, int quantity) {
    std::vector<Product> removed;
    for (auto tier = kAllQualities.rbegin(); tier != kAllQualities.rend(); ++tier) {
        int& held = count(type, *tier);
        while (held > 0 && static_cast<int>(removed.size()) < quantity) {
            --held;
            removed.emplace_back(type, *tier);
        }
    }
    return removed;
}

std::vector<Product> FancyInventory::all_products() const {
    std::vector<Product> products;
    for (StockType type : kAllStockTypes) {
        for (Quality quality : kAllQualities) {
            products.insert(products.end(), static_cast<std::size_t>(count(type, quality)),
                Product(type, quality));
        }
    }
    return products;
}

int FancyInventory::stocked_quantity(StockType type) const {
    int total = 0;
    for (Quality quality : kAllQualities) {
        total += count(type, quality);
    }
    return total;
}

// =============================================================================
// Factory
// =============================================================================

std::string to_string(InventoryKind kind) {
    return kind == InventoryKind::Basic ? "basic" : "fancy";
}

std::unique_ptr<Inventory> make_inventory(InventoryKind kind) {
    if (kind == InventoryKind::Basic) {
        return std::make_unique<BasicInventory>();
    }
    return std::make_unique<FancyInventory>();
}

}  // namespace homestead
