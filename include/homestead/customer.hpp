#pragma once

#include <memory>
#include <string>
#include <vector>
#include "homestead/cart.hpp"

namespace homestead {

/**
 * A shopper known to the farm. Identity is (name, phone number); the cart
 * belongs to the customer and outlives any single transaction.
 */
class Customer {
public:
    Customer(std::string name, int phone_number, std::string address);

    const std::string& name() const { return name_; }
    int phone_number() const { return phone_number_; }
    const std::string& address() const { return address_; }

    void set_name(const std::string& name);
    void set_phone_number(int phone_number) { phone_number_ = phone_number; }
    void set_address(const std::string& address) { address_ = address; }

    Cart& cart() { return cart_; }
    const Cart& cart() const { return cart_; }

    bool operator==(const Customer& other) const {
        return name_ == other.name_ && phone_number_ == other.phone_number_;
    }
    bool operator!=(const Customer& other) const { return !(*this == other); }

private:
    std::string name_;
    int phone_number_;
    std::string address_;
    Cart cart_;
};

/// "Name: Ali | Phone Number: 1234 | Address: 1 Farm Rd"
std::string to_string(const Customer& customer);

/**
 * Customer directory. Records are kept in insertion order.
 */
class AddressBook {
public:
    /**
     * @throws DuplicateEntityError if an equal customer is already recorded
     */
    void add(std::shared_ptr<Customer> customer);

    bool contains(const Customer& customer) const;

    /**
     * @throws EntityNotFoundError if no customer has this name and phone number
     */
    std::shared_ptr<Customer> get(const std::string& name, int phone_number) const;

    std::vector<std::shared_ptr<Customer>> all_records() const { return customers_; }

private:
    std::vector<std::shared_ptr<Customer>> customers_;
};

}  // namespace homestead
