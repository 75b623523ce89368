#include "homestead/product.hpp"

namespace homestead {

namespace {

struct CatalogueEntry {
    const char* id;
    const char* name;
    int32_t price_cents;
};

// Indexed by StockType.
constexpr std::array<CatalogueEntry, kStockTypeCount> kCatalogue = {{
    {"EGG", "egg", 50},
    {"MILK", "milk", 440},
    {"JAM", "jam", 670},
    {"WOOL", "wool", 3000},
}};

const CatalogueEntry& entry(StockType type) {
    return kCatalogue[static_cast<std::size_t>(type)];
}

}  // namespace

int32_t base_price(StockType type) {
    return entry(type).price_cents;
}

std::string display_name(StockType type) {
    return entry(type).name;
}

std::string to_string(StockType type) {
    return entry(type).id;
}

std::string to_string(Quality quality) {
    switch (quality) {
        case Quality::Regular: return "REGULAR";
        case Quality::Silver: return "SILVER";
        case Quality::Gold: return "GOLD";
        case Quality::Iridium: return "IRIDIUM";
    }
    return "REGULAR";
}

std::string to_string(const Product& product) {
    return product.display_name() + ": " + std::to_string(product.base_price()) + "c *"
        + to_string(product.quality()) + "*";
}

}  // namespace homestead
