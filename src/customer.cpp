#include "homestead/customer.hpp"
#include "homestead/errors.hpp"
#include "homestead/logging.hpp"
#include "homestead/validation.hpp"
#include <algorithm>
#include <utility>

namespace homestead {

Customer::Customer(std::string name, int phone_number, std::string address)
    : name_(std::move(name)), phone_number_(phone_number), address_(std::move(address)) {
    validation::require_not_empty(name_, "Customer name");
}

void Customer::set_name(const std::string& name) {
    validation::require_not_empty(name, "Customer name");
    name_ = name;
}

std::string to_string(const Customer& customer) {
    return "Name: " + customer.name() + " | Phone Number: " + std::to_string(customer.phone_number())
        + " | Address: " + customer.address();
}

void AddressBook::add(std::shared_ptr<Customer> customer) {
    validation::require_present(customer, "Customer");
    if (contains(*customer)) {
        throw DuplicateEntityError(to_string(*customer));
    }
    log_debug("address_book", "customer_added",
        {{"name", customer->name()}, {"phone_number", customer->phone_number()}});
    customers_.push_back(std::move(customer));
}

bool AddressBook::contains(const Customer& customer) const {
    return std::any_of(customers_.begin(), customers_.end(),
        [&customer](const std::shared_ptr<Customer>& c) { return *c == customer; });
}

std::shared_ptr<Customer> AddressBook::get(const std::string& name, int phone_number) const {
    for (const auto& c : customers_) {
        if (c->name() == name && c->phone_number() == phone_number) {
            return c;
        }
    }
    throw EntityNotFoundError("No customer named " + name + " with phone number "
        + std::to_string(phone_number));
}

}  // namespace homestead
