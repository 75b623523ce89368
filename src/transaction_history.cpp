#include "homestead/transaction_history.hpp"
#include "homestead/errors.hpp"
#include "homestead/helpers.hpp"
#include "homestead/logging.hpp"
#include "homestead/validation.hpp"
#include <array>
#include <utility>

namespace homestead {

bool TransactionHistory::record(std::shared_ptr<Transaction> transaction) {
    validation::require_present(transaction, "Transaction");
    if (!transaction->is_finalised()) {
        throw FailedTransactionError("Only finalised transactions can be recorded");
    }
    if (transaction->purchases().empty()) {
        log_debug("transaction_history", "empty_transaction_skipped",
            {{"customer", transaction->customer()->name()}});
        return false;
    }

    log_info("transaction_history", "transaction_recorded",
        {{"customer", transaction->customer()->name()},
         {"kind", to_string(transaction->kind())},
         {"total_cents", transaction->total()},
         {"position", transactions_.size()}});

    transactions_.push_back(std::move(transaction));
    return true;
}

std::shared_ptr<Transaction> TransactionHistory::last_transaction() const {
    if (transactions_.empty()) {
        throw EntityNotFoundError("No transactions have been recorded");
    }
    return transactions_.back();
}

int64_t TransactionHistory::gross_earnings() const {
    int64_t total = 0;
    for (const auto& t : transactions_) {
        total += t->total();
    }
    return total;
}

int64_t TransactionHistory::gross_earnings(StockType type) const {
    return static_cast<int64_t>(total_products_sold(type)) * base_price(type);
}

int32_t TransactionHistory::total_products_sold() const {
    int32_t sold = 0;
    for (const auto& t : transactions_) {
        sold += static_cast<int32_t>(t->purchases().size());
    }
    return sold;
}

int32_t TransactionHistory::total_products_sold(StockType type) const {
    int32_t sold = 0;
    for (const auto& t : transactions_) {
        sold += t->purchase_quantity(type);
    }
    return sold;
}

std::shared_ptr<Transaction> TransactionHistory::highest_grossing_transaction() const {
    std::shared_ptr<Transaction> best;
    int64_t best_total = 0;
    for (const auto& t : transactions_) {
        int64_t total = t->total();
        if (!best || total > best_total) {
            best = t;
            best_total = total;
        }
    }
    return best;
}

StockType TransactionHistory::most_popular_product() const {
    std::array<int32_t, kStockTypeCount> sold{};
    for (const auto& t : transactions_) {
        for (const auto& p : t->purchases()) {
            ++sold[static_cast<std::size_t>(p.type())];
        }
    }

    StockType popular = StockType::Egg;
    int32_t most = 0;
    for (StockType type : kAllStockTypes) {
        if (sold[static_cast<std::size_t>(type)] > most) {
            popular = type;
            most = sold[static_cast<std::size_t>(type)];
        }
    }
    return popular;
}

double TransactionHistory::average_spend_per_visit() const {
    if (transactions_.empty()) return 0.0;
    return static_cast<double>(gross_earnings()) / total_transactions();
}

double TransactionHistory::average_product_discount(StockType type) const {
    int32_t discounts = 0;
    for (const auto& t : transactions_) {
        discounts += t->discount_amount(type);
    }
    if (discounts <= 0) return 0.0;

    // Averaged over every visit, not only the ones that discounted `type`.
    return static_cast<double>(discounts) / total_transactions();
}

records::HistorySummary TransactionHistory::summary() const {
    records::HistorySummary summary;
    summary.set_total_transactions(total_transactions());
    summary.set_total_products_sold(total_products_sold());
    summary.set_gross_earnings_cents(gross_earnings());
    summary.set_average_spend_per_visit(average_spend_per_visit());
    summary.set_most_popular_product(to_string(most_popular_product()));
    if (auto best = highest_grossing_transaction()) {
        summary.set_highest_grossing_total_cents(best->total());
    }

    for (StockType type : kAllStockTypes) {
        auto* tally = summary.add_tallies();
        tally->set_stock_type(to_string(type));
        tally->set_units_sold(total_products_sold(type));
        tally->set_gross_cents(gross_earnings(type));
        tally->set_average_discount(average_product_discount(type));
    }

    *summary.mutable_generated_at() = helpers::now();
    return summary;
}

}  // namespace homestead
