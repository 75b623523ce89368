#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace homestead {

/**
 * Stock-keeping identifiers. Declaration order is significant: it is the
 * grouping order for listings and receipts and the tie-break order for
 * popularity.
 */
enum class StockType { Egg, Milk, Jam, Wool };

/**
 * Quality tiers, lowest to highest.
 */
enum class Quality { Regular, Silver, Gold, Iridium };

constexpr std::size_t kStockTypeCount = 4;
constexpr std::size_t kQualityCount = 4;

constexpr std::array<StockType, kStockTypeCount> kAllStockTypes = {
    StockType::Egg, StockType::Milk, StockType::Jam, StockType::Wool};

constexpr std::array<Quality, kQualityCount> kAllQualities = {
    Quality::Regular, Quality::Silver, Quality::Gold, Quality::Iridium};

/// Base price of one unit, in cents.
int32_t base_price(StockType type);

/// Lower-case name printed on receipts.
std::string display_name(StockType type);

/// Upper-case identifier, e.g. "EGG".
std::string to_string(StockType type);

/// Upper-case tier name, e.g. "IRIDIUM".
std::string to_string(Quality quality);

/**
 * One unit of stock. Two products with the same type and quality are
 * interchangeable.
 */
class Product {
public:
    explicit Product(StockType type, Quality quality = Quality::Regular)
        : type_(type), quality_(quality) {}

    StockType type() const { return type_; }
    Quality quality() const { return quality_; }

    int32_t base_price() const { return homestead::base_price(type_); }
    std::string display_name() const { return homestead::display_name(type_); }

    bool operator==(const Product& other) const {
        return type_ == other.type_ && quality_ == other.quality_;
    }
    bool operator!=(const Product& other) const { return !(*this == other); }

private:
    StockType type_;
    Quality quality_;
};

/// "egg: 50c *GOLD*"
std::string to_string(const Product& product);

}  // namespace homestead

namespace std {

template<>
struct hash<homestead::Product> {
    size_t operator()(const homestead::Product& product) const noexcept {
        return static_cast<size_t>(product.type()) * homestead::kQualityCount
            + static_cast<size_t>(product.quality());
    }
};

}  // namespace std
