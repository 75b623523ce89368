#pragma once

#include <memory>
#include <string>
#include <vector>
#include "homestead/config.hpp"
#include "homestead/customer.hpp"
#include "homestead/inventory.hpp"
#include "homestead/product.hpp"
#include "homestead/receipt_renderer.hpp"
#include "homestead/transaction.hpp"
#include "homestead/transaction_history.hpp"
#include "homestead/transaction_manager.hpp"

namespace homestead {

/**
 * The shop front: stock, customers, the till and the sales ledger.
 *
 * Capability differences between inventory strategies are left to the
 * inventory itself; the farm never asks which strategy it holds.
 */
class Farm {
public:
    Farm(std::unique_ptr<Inventory> inventory, AddressBook address_book);

    /// Farm with an empty address book and the configured inventory strategy.
    /// Also applies the configured log level.
    static Farm from_config(const Config& config);

    std::vector<std::shared_ptr<Customer>> all_customers() const;
    std::vector<Product> all_stock() const;

    /// @throws DuplicateEntityError
    void save_customer(std::shared_ptr<Customer> customer);

    /// @throws EntityNotFoundError
    std::shared_ptr<Customer> get_customer(const std::string& name, int phone_number) const;

    void stock_product(StockType type, Quality quality);

    /**
     * @throws InvalidArgumentError if quantity < 1
     * @throws InvalidStockRequestError if the inventory cannot stock in bulk
     */
    void stock_product(StockType type, Quality quality, int quantity);

    /// @throws FailedTransactionError if a transaction is already open
    void start_transaction(std::shared_ptr<Transaction> transaction);

    /**
     * Move the best unit of `type` from stock into the open cart.
     * @return number of units added (0 or 1)
     * @throws FailedTransactionError if no transaction is open
     */
    int add_to_cart(StockType type);

    /**
     * @return number of units added, possibly fewer than requested
     * @throws FailedTransactionError if no transaction is open, or the
     *         inventory cannot remove in bulk
     * @throws InvalidArgumentError if quantity < 1
     */
    int add_to_cart(StockType type, int quantity);

    /**
     * Close the open transaction; record it if anything was bought.
     * @return true if the transaction was recorded
     * @throws FailedTransactionError if no transaction is open
     */
    bool checkout();

    /// @throws EntityNotFoundError if no sale has been recorded
    std::string last_receipt() const;

    TransactionManager& transaction_manager() { return manager_; }
    const TransactionHistory& history() const { return history_; }
    const Inventory& inventory() const { return *inventory_; }

private:
    void require_shopping() const;

    std::unique_ptr<Inventory> inventory_;
    AddressBook address_book_;
    TransactionManager manager_;
    TransactionHistory history_;
    ReceiptRenderer renderer_;
};

}  // namespace homestead
