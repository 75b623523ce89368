#pragma once

#include <string>
#include "errors.hpp"

namespace homestead {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be at least 1");
    }
}

/**
 * Require that a pointer-like handle is set.
 */
template<typename P>
void require_present(const P& handle, const std::string& field_name = "value") {
    if (!handle) {
        throw InvalidArgumentError(field_name + " must not be null");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require that a transaction is open before acting on it.
 */
inline void require_ongoing(bool ongoing, const std::string& message = "No transaction is in progress") {
    if (!ongoing) {
        throw FailedTransactionError(message);
    }
}

/**
 * Require that no transaction is open.
 */
inline void require_not_ongoing(bool ongoing, const std::string& message = "A transaction is already in progress") {
    if (ongoing) {
        throw FailedTransactionError(message);
    }
}

} // namespace validation
} // namespace homestead
