#include <gtest/gtest.h>
#include <memory>
#include <vector>
#include "homestead/errors.hpp"
#include "homestead/transaction_history.hpp"
#include "homestead/transaction_manager.hpp"

using namespace homestead;

class TransactionHistoryTest : public ::testing::Test {
protected:
    TransactionHistory history;
    std::shared_ptr<Customer> customer = std::make_shared<Customer>("Ali", 1111, "1 Paddock Lane");

    std::shared_ptr<Transaction> finished(std::shared_ptr<Transaction> transaction,
                                          const std::vector<Product>& products) {
        for (const auto& p : products) {
            customer->cart().add(p);
        }
        transaction->finalise();
        return transaction;
    }

    std::shared_ptr<Transaction> sale(const std::vector<Product>& products) {
        return finished(Transaction::plain(customer), products);
    }

    static std::vector<Product> units(StockType type, int count) {
        return std::vector<Product>(static_cast<std::size_t>(count), Product(type));
    }
};

// =============================================================================
// Empty History Tests
// =============================================================================

TEST_F(TransactionHistoryTest, Empty_ShouldReturnDefaults) {
    EXPECT_EQ(history.total_transactions(), 0);
    EXPECT_EQ(history.gross_earnings(), 0);
    EXPECT_EQ(history.total_products_sold(), 0);
    EXPECT_EQ(history.most_popular_product(), StockType::Egg);
    EXPECT_DOUBLE_EQ(history.average_spend_per_visit(), 0.0);
    EXPECT_DOUBLE_EQ(history.average_product_discount(StockType::Milk), 0.0);
    EXPECT_EQ(history.highest_grossing_transaction(), nullptr);
}

TEST_F(TransactionHistoryTest, Empty_LastTransactionShouldThrowNotFound) {
    EXPECT_THROW(history.last_transaction(), EntityNotFoundError);
}

// =============================================================================
// Recording Tests
// =============================================================================

TEST_F(TransactionHistoryTest, Record_ShouldAppendInOrder) {
    auto first = sale(units(StockType::Egg, 1));
    auto second = sale(units(StockType::Milk, 1));

    history.record(first);
    history.record(second);

    ASSERT_EQ(history.transactions().size(), 2u);
    EXPECT_EQ(history.transactions()[0], first);
    EXPECT_EQ(history.last_transaction(), second);
}

TEST_F(TransactionHistoryTest, Record_ActiveTransaction_ShouldThrowFailedTransaction) {
    EXPECT_THROW(history.record(Transaction::plain(customer)), FailedTransactionError);
    EXPECT_THROW(history.record(nullptr), InvalidArgumentError);
    EXPECT_EQ(history.total_transactions(), 0);
}

TEST_F(TransactionHistoryTest, Record_EmptyTransaction_ShouldBeSkipped) {
    TransactionManager manager;

    // Given one visit that bought wool
    manager.open(Transaction::plain(customer));
    manager.register_pending_purchase(Product(StockType::Wool));
    EXPECT_TRUE(history.record(manager.close()));

    // When a second visit leaves with nothing
    manager.open(Transaction::plain(customer));
    EXPECT_FALSE(history.record(manager.close()));

    // Then only the sale counts towards the statistics
    EXPECT_EQ(history.total_transactions(), 1);
    EXPECT_DOUBLE_EQ(history.average_spend_per_visit(), 3000.0);
    EXPECT_EQ(history.last_transaction()->purchase_quantity(StockType::Wool), 1);
}

// =============================================================================
// Aggregate Tests
// =============================================================================

TEST_F(TransactionHistoryTest, Totals_ShouldSumAcrossTransactions) {
    history.record(sale({Product(StockType::Egg), Product(StockType::Egg), Product(StockType::Milk)}));
    history.record(sale({Product(StockType::Wool)}));

    EXPECT_EQ(history.total_transactions(), 2);
    EXPECT_EQ(history.total_products_sold(), 4);
    EXPECT_EQ(history.total_products_sold(StockType::Egg), 2);
    EXPECT_EQ(history.total_products_sold(StockType::Jam), 0);
    EXPECT_EQ(history.gross_earnings(), 540 + 3000);
    EXPECT_EQ(history.gross_earnings(StockType::Egg), 100);
    EXPECT_DOUBLE_EQ(history.average_spend_per_visit(), 1770.0);
}

TEST_F(TransactionHistoryTest, GrossEarnings_ShouldUseDiscountedTotalsButBasePricePerType) {
    history.record(finished(Transaction::special_sale(customer, {{StockType::Milk, 50}}),
                            units(StockType::Milk, 2)));

    EXPECT_EQ(history.gross_earnings(), 440);
    EXPECT_EQ(history.gross_earnings(StockType::Milk), 880);
}

TEST_F(TransactionHistoryTest, HighestGrossing_ShouldPreferFirstOfEqualTotals) {
    // Totals 500, 1200, 1200 in record order
    auto low = sale(units(StockType::Egg, 10));
    auto first_high = sale(units(StockType::Egg, 24));
    auto second_high = sale(units(StockType::Egg, 24));
    history.record(low);
    history.record(first_high);
    history.record(second_high);

    EXPECT_EQ(history.highest_grossing_transaction(), first_high);
    EXPECT_EQ(history.highest_grossing_transaction()->total(), 1200);
}

TEST_F(TransactionHistoryTest, MostPopular_ShouldCountUnitsAcrossTransactions) {
    history.record(sale(units(StockType::Milk, 2)));
    history.record(sale({Product(StockType::Jam), Product(StockType::Milk), Product(StockType::Jam)}));
    history.record(sale(units(StockType::Jam, 2)));

    EXPECT_EQ(history.most_popular_product(), StockType::Jam);
}

TEST_F(TransactionHistoryTest, MostPopular_ShouldBreakTiesByStockTypeOrder) {
    history.record(sale(units(StockType::Wool, 3)));
    history.record(sale(units(StockType::Milk, 3)));
    history.record(sale(units(StockType::Jam, 3)));

    EXPECT_EQ(history.most_popular_product(), StockType::Milk);
}

TEST_F(TransactionHistoryTest, AverageProductDiscount_ShouldDivideByAllTransactions) {
    // Given one 20% special sale, one 10% special sale and two plain sales
    history.record(finished(Transaction::special_sale(customer, {{StockType::Egg, 20}}),
                            units(StockType::Egg, 1)));
    history.record(finished(Transaction::special_sale(customer, {{StockType::Egg, 10}}),
                            units(StockType::Milk, 1)));
    history.record(sale(units(StockType::Egg, 1)));
    history.record(finished(Transaction::categorised(customer), units(StockType::Egg, 1)));

    // Then the average is (20 + 10) / 4
    EXPECT_DOUBLE_EQ(history.average_product_discount(StockType::Egg), 7.5);
    EXPECT_DOUBLE_EQ(history.average_product_discount(StockType::Milk), 0.0);
}

// =============================================================================
// Summary Tests
// =============================================================================

TEST_F(TransactionHistoryTest, GrossEarnings_LargeVolume_ShouldNotOverflow) {
    history.record(sale(units(StockType::Wool, 400000)));
    history.record(sale(units(StockType::Wool, 400000)));

    EXPECT_EQ(history.gross_earnings(), 2400000000LL);
    EXPECT_EQ(history.gross_earnings(StockType::Wool), 2400000000LL);
}

TEST_F(TransactionHistoryTest, Summary_ShouldMirrorQueries) {
    history.record(sale({Product(StockType::Egg), Product(StockType::Wool)}));
    history.record(sale(units(StockType::Egg, 2)));

    auto summary = history.summary();

    EXPECT_EQ(summary.total_transactions(), 2);
    EXPECT_EQ(summary.total_products_sold(), 4);
    EXPECT_EQ(summary.gross_earnings_cents(), 3150);
    EXPECT_EQ(summary.most_popular_product(), "EGG");
    EXPECT_EQ(summary.highest_grossing_total_cents(), 3050);
    ASSERT_EQ(summary.tallies_size(), 4);
    EXPECT_EQ(summary.tallies(0).stock_type(), "EGG");
    EXPECT_EQ(summary.tallies(0).units_sold(), 3);
    EXPECT_EQ(summary.tallies(3).gross_cents(), 3000);
    EXPECT_GT(summary.generated_at().seconds(), 0);
}
