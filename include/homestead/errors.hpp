#pragma once

#include <stdexcept>
#include <string>

namespace homestead {

/**
 * Machine-readable classification of a HomesteadError.
 */
enum class ErrorCode {
    Unknown,
    DuplicateEntity,
    EntityNotFound,
    InvalidStockRequest,
    FailedTransaction,
    InvalidArgument
};

/**
 * Base exception for all homestead errors.
 */
class HomesteadError : public std::runtime_error {
public:
    explicit HomesteadError(const std::string& message)
        : std::runtime_error(message) {}

    virtual ErrorCode code() const { return ErrorCode::Unknown; }

    /**
     * Returns true if an equal entity was already present.
     */
    bool is_duplicate() const { return code() == ErrorCode::DuplicateEntity; }

    /**
     * Returns true if this is a "not found" error.
     */
    bool is_not_found() const { return code() == ErrorCode::EntityNotFound; }

    /**
     * Returns true if a stock operation was refused by the inventory strategy.
     */
    bool is_invalid_stock_request() const { return code() == ErrorCode::InvalidStockRequest; }

    /**
     * Returns true if the transaction lifecycle was violated.
     */
    bool is_failed_transaction() const { return code() == ErrorCode::FailedTransaction; }

    /**
     * Returns true if an invalid argument was provided.
     */
    bool is_invalid_argument() const { return code() == ErrorCode::InvalidArgument; }
};

/**
 * Thrown when adding an entity that is already present.
 */
class DuplicateEntityError : public HomesteadError {
public:
    explicit DuplicateEntityError(const std::string& message)
        : HomesteadError(message) {}

    ErrorCode code() const override { return ErrorCode::DuplicateEntity; }
};

/**
 * Thrown when a lookup has no match.
 */
class EntityNotFoundError : public HomesteadError {
public:
    explicit EntityNotFoundError(const std::string& message)
        : HomesteadError(message) {}

    ErrorCode code() const override { return ErrorCode::EntityNotFound; }
};

/**
 * Thrown when stock is supplied in a way the inventory cannot accept.
 */
class InvalidStockRequestError : public HomesteadError {
public:
    explicit InvalidStockRequestError(const std::string& message)
        : HomesteadError(message) {}

    ErrorCode code() const override { return ErrorCode::InvalidStockRequest; }
};

/**
 * Thrown when a transaction cannot be opened, extended or closed,
 * or when stock cannot be taken out the way it was requested.
 */
class FailedTransactionError : public HomesteadError {
public:
    explicit FailedTransactionError(const std::string& message)
        : HomesteadError(message) {}

    ErrorCode code() const override { return ErrorCode::FailedTransaction; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public HomesteadError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : HomesteadError(message) {}

    ErrorCode code() const override { return ErrorCode::InvalidArgument; }
};

} // namespace homestead
