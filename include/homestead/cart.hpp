#pragma once

#include <cstddef>
#include <vector>
#include "homestead/product.hpp"

namespace homestead {

/// Products a customer has picked up but not yet paid for, in pick order.
class Cart {
public:
    void add(const Product& product) { products_.push_back(product); }

    std::vector<Product> contents() const { return products_; }

    void clear() { products_.clear(); }

    bool empty() const { return products_.empty(); }
    std::size_t size() const { return products_.size(); }

private:
    std::vector<Product> products_;
};

}  // namespace homestead
