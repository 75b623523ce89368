#include "homestead/transaction_manager.hpp"
#include "homestead/logging.hpp"
#include "homestead/validation.hpp"
#include <algorithm>
#include <utility>

namespace homestead {

bool TransactionManager::has_ongoing() const {
    return std::any_of(opened_.begin(), opened_.end(),
        [](const std::shared_ptr<Transaction>& t) { return !t->is_finalised(); });
}

void TransactionManager::open(std::shared_ptr<Transaction> transaction) {
    validation::require_present(transaction, "Transaction");
    validation::require_not_ongoing(has_ongoing(),
        "Cannot start a transaction while another is in progress");

    log_info("transaction_manager", "transaction_opened",
        {{"customer", transaction->customer()->name()},
         {"kind", to_string(transaction->kind())}});

    opened_.push_back(transaction);
    current_ = std::move(transaction);
}

void TransactionManager::register_pending_purchase(const Product& product) {
    validation::require_ongoing(has_ongoing(),
        "Cannot add to cart when no customer has started shopping");

    current_->customer()->cart().add(product);

    log_debug("transaction_manager", "purchase_registered",
        {{"customer", current_->customer()->name()},
         {"stock_type", to_string(product.type())},
         {"quality", to_string(product.quality())}});
}

std::shared_ptr<Transaction> TransactionManager::close() {
    validation::require_ongoing(has_ongoing(), "No transaction is in progress to close");

    current_->finalise();

    log_info("transaction_manager", "transaction_closed",
        {{"customer", current_->customer()->name()},
         {"items", current_->purchases().size()},
         {"total_cents", current_->total()}});

    return current_;
}

std::shared_ptr<Transaction> TransactionManager::current() const {
    return has_ongoing() ? current_ : nullptr;
}

}  // namespace homestead
