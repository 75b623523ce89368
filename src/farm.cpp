#include "homestead/farm.hpp"
#include "homestead/errors.hpp"
#include "homestead/logging.hpp"
#include "homestead/validation.hpp"
#include <utility>

namespace homestead {

Farm::Farm(std::unique_ptr<Inventory> inventory, AddressBook address_book)
    : inventory_(std::move(inventory)), address_book_(std::move(address_book)) {
    validation::require_present(inventory_, "Inventory");
}

Farm Farm::from_config(const Config& config) {
    config.apply();
    log_info("farm", "farm_created", {{"inventory", to_string(config.inventory)}});
    return Farm(make_inventory(config.inventory), AddressBook{});
}

std::vector<std::shared_ptr<Customer>> Farm::all_customers() const {
    return address_book_.all_records();
}

std::vector<Product> Farm::all_stock() const {
    return inventory_->all_products();
}

void Farm::save_customer(std::shared_ptr<Customer> customer) {
    address_book_.add(customer);
    log_info("farm", "customer_saved", {{"name", customer->name()}});
}

std::shared_ptr<Customer> Farm::get_customer(const std::string& name, int phone_number) const {
    return address_book_.get(name, phone_number);
}

void Farm::stock_product(StockType type, Quality quality) {
    inventory_->add(type, quality);
}

void Farm::stock_product(StockType type, Quality quality, int quantity) {
    validation::require_positive(quantity, "Quantity");
    inventory_->add(type, quality, quantity);
    log_debug("farm", "stock_added",
        {{"stock_type", to_string(type)}, {"quality", to_string(quality)}, {"quantity", quantity}});
}

void Farm::start_transaction(std::shared_ptr<Transaction> transaction) {
    manager_.open(std::move(transaction));
}

void Farm::require_shopping() const {
    validation::require_ongoing(manager_.has_ongoing(),
        "Cannot add to cart when no customer has started shopping");
}

int Farm::add_to_cart(StockType type) {
    require_shopping();
    if (!inventory_->exists(type)) {
        return 0;
    }
    int added = 0;
    for (const auto& product : inventory_->remove(type)) {
        manager_.register_pending_purchase(product);
        ++added;
    }
    return added;
}

int Farm::add_to_cart(StockType type, int quantity) {
    require_shopping();
    validation::require_positive(quantity, "Quantity");
    if (quantity == 1) {
        return add_to_cart(type);
    }
    int added = 0;
    for (const auto& product : inventory_->remove(type, quantity)) {
        manager_.register_pending_purchase(product);
        ++added;
    }
    return added;
}

bool Farm::checkout() {
    auto completed = manager_.close();
    if (!history_.record(completed)) {
        log_info("farm", "checkout_empty", {{"customer", completed->customer()->name()}});
        return false;
    }
    return true;
}

std::string Farm::last_receipt() const {
    return renderer_.render(history_.last_transaction()->receipt());
}

}  // namespace homestead
