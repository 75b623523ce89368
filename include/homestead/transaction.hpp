#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "homestead/customer.hpp"
#include "homestead/pricing.hpp"
#include "homestead/product.hpp"
#include "records.pb.h"

namespace homestead {

/**
 * How a sale is priced and printed.
 *
 * Plain lists every unit at base price. Categorised groups units by stock
 * type. SpecialSale groups like Categorised and applies per-type discounts.
 */
enum class TransactionKind { Plain, Categorised, SpecialSale };

std::string to_string(TransactionKind kind);

/**
 * One customer's visit, from first item to checkout.
 *
 * While active the purchases are whatever is in the customer's cart at the
 * moment of the call. finalise() copies the cart into the transaction,
 * empties the cart and freezes the purchase list for good.
 *
 * Pricing is delegated to homestead::pricing; the kind only decides whether
 * a discount map takes part and how the receipt is laid out.
 */
class Transaction {
public:
    /**
     * @throws InvalidArgumentError if customer is null, or if discounts are
     *         supplied for a kind other than SpecialSale
     */
    explicit Transaction(std::shared_ptr<Customer> customer,
                         TransactionKind kind = TransactionKind::Plain,
                         DiscountMap discounts = {});

    static std::shared_ptr<Transaction> plain(std::shared_ptr<Customer> customer);
    static std::shared_ptr<Transaction> categorised(std::shared_ptr<Customer> customer);
    static std::shared_ptr<Transaction> special_sale(std::shared_ptr<Customer> customer,
                                                     DiscountMap discounts = {});

    TransactionKind kind() const { return kind_; }
    const std::shared_ptr<Customer>& customer() const { return customer_; }

    bool is_finalised() const { return std::holds_alternative<Settled>(purchases_); }

    /**
     * Copy of the current purchases. Live cart contents while active, the
     * frozen list once finalised.
     */
    std::vector<Product> purchases() const;

    /// Price of all purchases in cents, recomputed on every call.
    int64_t total() const;

    /**
     * Snapshot the cart, clear it and mark the transaction finalised.
     * @throws FailedTransactionError if already finalised
     */
    void finalise();

    // Grouped views, available for every kind.
    std::set<StockType> purchased_types() const;
    std::map<StockType, std::vector<Product>> purchases_by_type() const;
    int32_t purchase_quantity(StockType type) const;
    int64_t purchase_subtotal(StockType type) const;

    /// Configured percentage off `type`; 0 unless this is a special sale that discounts it.
    int32_t discount_amount(StockType type) const;

    /// Null unless this is a special sale.
    const DiscountMap* discounts() const { return discounts_ ? &*discounts_ : nullptr; }

    /// Undiscounted value of the purchases minus total().
    int64_t total_saved() const;

    /// Receipt data for the renderer. Pending until finalised.
    records::Receipt receipt() const;

private:
    // Purchases are read from the customer's cart.
    struct Observing {
        const Cart* cart;
    };
    // Purchases were copied out of the cart at finalise time.
    struct Settled {
        std::vector<Product> products;
    };

    void fill_grouped_rows(records::Receipt& receipt) const;

    std::shared_ptr<Customer> customer_;
    TransactionKind kind_;
    std::optional<DiscountMap> discounts_;
    std::variant<Observing, Settled> purchases_;
};

/// "Transaction {Customer: Ali | ..., Status: Active, Associated Products: [...]}"
std::string to_string(const Transaction& transaction);

}  // namespace homestead
