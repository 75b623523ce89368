#include "homestead/transaction.hpp"
#include "homestead/errors.hpp"
#include "homestead/helpers.hpp"
#include "homestead/logging.hpp"
#include "homestead/validation.hpp"
#include <sstream>
#include <utility>

namespace homestead {

std::string to_string(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::Plain: return "plain";
        case TransactionKind::Categorised: return "categorised";
        case TransactionKind::SpecialSale: return "special_sale";
    }
    return "plain";
}

Transaction::Transaction(std::shared_ptr<Customer> customer, TransactionKind kind,
                         DiscountMap discounts)
    : customer_(std::move(customer)), kind_(kind), purchases_(Observing{nullptr}) {
    validation::require_present(customer_, "Transaction customer");
    if (kind_ == TransactionKind::SpecialSale) {
        discounts_ = std::move(discounts);
    } else if (!discounts.empty()) {
        throw InvalidArgumentError("Only a special sale can carry discounts");
    }
    purchases_ = Observing{&customer_->cart()};
}

std::shared_ptr<Transaction> Transaction::plain(std::shared_ptr<Customer> customer) {
    return std::make_shared<Transaction>(std::move(customer), TransactionKind::Plain);
}

std::shared_ptr<Transaction> Transaction::categorised(std::shared_ptr<Customer> customer) {
    return std::make_shared<Transaction>(std::move(customer), TransactionKind::Categorised);
}

std::shared_ptr<Transaction> Transaction::special_sale(std::shared_ptr<Customer> customer,
                                                       DiscountMap discounts) {
    return std::make_shared<Transaction>(
        std::move(customer), TransactionKind::SpecialSale, std::move(discounts));
}

std::vector<Product> Transaction::purchases() const {
    if (const auto* settled = std::get_if<Settled>(&purchases_)) {
        return settled->products;
    }
    return std::get<Observing>(purchases_).cart->contents();
}

int64_t Transaction::total() const {
    return pricing::total(purchases(), discounts());
}

void Transaction::finalise() {
    if (is_finalised()) {
        throw FailedTransactionError("Transaction has already been finalised");
    }
    Cart& cart = customer_->cart();
    purchases_ = Settled{cart.contents()};
    cart.clear();

    log_debug("transaction", "transaction_finalised",
        {{"customer", customer_->name()}, {"kind", to_string(kind_)},
         {"items", std::get<Settled>(purchases_).products.size()}});
}

std::set<StockType> Transaction::purchased_types() const {
    return pricing::purchased_types(purchases());
}

std::map<StockType, std::vector<Product>> Transaction::purchases_by_type() const {
    return pricing::group_by_type(purchases());
}

int32_t Transaction::purchase_quantity(StockType type) const {
    return pricing::quantity_of(purchases(), type);
}

int64_t Transaction::purchase_subtotal(StockType type) const {
    return pricing::subtotal(purchases(), type, discounts());
}

int32_t Transaction::discount_amount(StockType type) const {
    return pricing::discount_for(discounts(), type);
}

int64_t Transaction::total_saved() const {
    auto bought = purchases();
    return pricing::base_total(bought) - pricing::total(bought, discounts());
}

records::Receipt Transaction::receipt() const {
    records::Receipt receipt;
    if (!is_finalised()) {
        receipt.set_pending(true);
        return receipt;
    }

    receipt.set_customer_name(customer_->name());
    receipt.set_total(helpers::format_cents(total()));

    if (kind_ == TransactionKind::Plain) {
        receipt.add_headers("Item");
        receipt.add_headers("Price");
        for (const auto& p : purchases()) {
            auto* row = receipt.add_rows();
            row->add_cells(p.display_name());
            row->add_cells(helpers::format_cents(p.base_price()));
        }
        return receipt;
    }

    fill_grouped_rows(receipt);

    int64_t saved = total_saved();
    if (kind_ == TransactionKind::SpecialSale && saved > 0) {
        receipt.set_savings(helpers::format_cents(saved));
    }
    return receipt;
}

void Transaction::fill_grouped_rows(records::Receipt& receipt) const {
    for (const char* header : {"Item", "Qty", "Price (ea.)", "Subtotal"}) {
        receipt.add_headers(header);
    }

    auto bought = purchases();
    for (StockType type : kAllStockTypes) {
        int32_t quantity = pricing::quantity_of(bought, type);
        if (quantity == 0) continue;

        auto* row = receipt.add_rows();
        row->add_cells(display_name(type));
        row->add_cells(std::to_string(quantity));
        row->add_cells(helpers::format_cents(base_price(type)));
        row->add_cells(helpers::format_cents(pricing::subtotal(bought, type, discounts())));

        int32_t percent = discount_amount(type);
        if (percent > 0) {
            row->add_cells("Discount applied! " + std::to_string(percent) + "% off "
                + display_name(type));
        }
    }
}

std::string to_string(const Transaction& transaction) {
    std::ostringstream out;
    // Drop the leading "Name" so the line reads "Customer: <name> | ...".
    out << "Transaction {Customer" << to_string(*transaction.customer()).substr(4)
        << ", Status: " << (transaction.is_finalised() ? "Finalised" : "Active")
        << ", Associated Products: [";
    const auto bought = transaction.purchases();
    for (std::size_t i = 0; i < bought.size(); ++i) {
        if (i > 0) out << ", ";
        out << to_string(bought[i]);
    }
    out << "]";

    if (const auto* discounts = transaction.discounts()) {
        out << ", Discounts: {";
        bool first = true;
        for (const auto& [type, percent] : *discounts) {
            if (!first) out << ", ";
            out << to_string(type) << "=" << percent;
            first = false;
        }
        out << "}";
    }
    out << "}";
    return out.str();
}

}  // namespace homestead
