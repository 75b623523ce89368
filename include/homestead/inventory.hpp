#pragma once

#include <array>
#include <memory>
#include <string>
#include <vector>
#include "homestead/product.hpp"

namespace homestead {

enum class InventoryKind { Basic, Fancy };

/**
 * In-memory store of product units.
 *
 * Strategies differ in which quantities they accept. A strategy that cannot
 * honour a request throws; callers never need to know which strategy they
 * hold.
 */
class Inventory {
public:
    virtual ~Inventory() = default;

    /**
     * Stock one unit.
     */
    virtual void add(StockType type, Quality quality) = 0;

    /**
     * Stock `quantity` units of the same type and quality.
     * @throws InvalidStockRequestError if the strategy cannot stock in bulk
     */
    virtual void add(StockType type, Quality quality, int quantity) = 0;

    virtual bool exists(StockType type) const = 0;

    /**
     * Take out the highest-quality unit of `type`.
     * @return the removed unit, or an empty list if none is stocked
     */
    virtual std::vector<Product> remove(StockType type) = 0;

    /**
     * Take out up to `quantity` units of `type`, best quality first.
     * @return the removed units, possibly fewer than requested
     * @throws FailedTransactionError if the strategy cannot remove in bulk
     */
    virtual std::vector<Product> remove(StockType type, int quantity) = 0;

    virtual std::vector<Product> all_products() const = 0;

    virtual int stocked_quantity(StockType type) const = 0;
};

/**
 * Unit-at-a-time inventory backed by a flat list.
 */
class BasicInventory : public Inventory {
public:
    void add(StockType type, Quality quality) override;
    void add(StockType type, Quality quality, int quantity) override;
    bool exists(StockType type) const override;
    std::vector<Product> remove(StockType type) override;
    std::vector<Product> remove(StockType type, int quantity) override;
    std::vector<Product> all_products() const override;
    int stocked_quantity(StockType type) const override;

private:
    std::vector<Product> products_;
};

/**
 * Bulk-capable inventory. Units are interchangeable, so stock is kept as a
 * count per (type, quality).
 */
class FancyInventory : public Inventory {
public:
    FancyInventory();

    void add(StockType type, Quality quality) override;
    void add(StockType type, Quality quality, int quantity) override;
    bool exists(StockType type) const override;
    std::vector<Product> remove(StockType type) override;
    std::vector<Product> remove(StockType type, int quantity) override;

    /// Grouped by stock type in declaration order, lowest quality first within a type.
    std::vector<Product> all_products() const override;
    int stocked_quantity(StockType type) const override;

private:
    int& count(StockType type, Quality quality);
    int count(StockType type, Quality quality) const;

    std::array<std::array<int, kQualityCount>, kStockTypeCount> counts_;
};

std::string to_string(InventoryKind kind);

std::unique_ptr<Inventory> make_inventory(InventoryKind kind);

}  // namespace homestead
