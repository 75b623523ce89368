#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include "homestead/product.hpp"
#include "homestead/transaction.hpp"
#include "records.pb.h"

namespace homestead {

/**
 * Append-only log of completed sales with aggregate statistics.
 *
 * Every statistic is recomputed from the log on each call. Where ties are
 * possible the earliest recorded transaction, or the stock type declared
 * first, wins.
 */
class TransactionHistory {
public:
    /**
     * Append a completed sale. A transaction that bought nothing is not kept.
     * @return true if the transaction was appended
     * @throws InvalidArgumentError if transaction is null
     * @throws FailedTransactionError if transaction is not finalised
     */
    bool record(std::shared_ptr<Transaction> transaction);

    /**
     * @throws EntityNotFoundError if nothing has been recorded
     */
    std::shared_ptr<Transaction> last_transaction() const;

    const std::vector<std::shared_ptr<Transaction>>& transactions() const { return transactions_; }

    /// Sum of transaction totals, discounts included.
    int64_t gross_earnings() const;

    /// Sum of base prices of every unit of `type` sold; discounts are ignored.
    int64_t gross_earnings(StockType type) const;

    int32_t total_transactions() const { return static_cast<int32_t>(transactions_.size()); }

    int32_t total_products_sold() const;
    int32_t total_products_sold(StockType type) const;

    /// First transaction with the largest total; null when empty.
    std::shared_ptr<Transaction> highest_grossing_transaction() const;

    /// Type with the most units sold; StockType::Egg when empty.
    StockType most_popular_product() const;

    /// gross_earnings() / total_transactions(), or 0.
    double average_spend_per_visit() const;

    /**
     * Sum of the discount percentages special sales configured for `type`,
     * divided by the number of recorded transactions of any kind.
     */
    double average_product_discount(StockType type) const;

    records::HistorySummary summary() const;

private:
    std::vector<std::shared_ptr<Transaction>> transactions_;
};

}  // namespace homestead
