#pragma once

#include <memory>
#include <vector>
#include "homestead/product.hpp"
#include "homestead/transaction.hpp"

namespace homestead {

/**
 * Keeps at most one transaction open at a time and routes picked-up items
 * into the open transaction's cart.
 */
class TransactionManager {
public:
    /// True iff some transaction ever opened here is not yet finalised.
    bool has_ongoing() const;

    /**
     * @throws FailedTransactionError if a transaction is already open
     * @throws InvalidArgumentError if transaction is null
     */
    void open(std::shared_ptr<Transaction> transaction);

    /**
     * Add `product` to the cart of the open transaction's customer.
     * @throws FailedTransactionError if no transaction is open
     */
    void register_pending_purchase(const Product& product);

    /**
     * Finalise the open transaction and hand it back.
     * @throws FailedTransactionError if no transaction is open
     */
    std::shared_ptr<Transaction> close();

    /// The open transaction, or null.
    std::shared_ptr<Transaction> current() const;

    const std::vector<std::shared_ptr<Transaction>>& opened() const { return opened_; }

private:
    std::vector<std::shared_ptr<Transaction>> opened_;
    std::shared_ptr<Transaction> current_;
};

}  // namespace homestead
