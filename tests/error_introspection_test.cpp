#include <gtest/gtest.h>
#include "homestead/errors.hpp"
#include "homestead/validation.hpp"

using namespace homestead;

// =============================================================================
// Introspection Tests
// =============================================================================

TEST(ErrorIntrospectionTest, DuplicateEntityError_ShouldReturnTrueForIsDuplicate) {
    DuplicateEntityError error("already there");
    EXPECT_TRUE(error.is_duplicate());
    EXPECT_EQ(error.code(), ErrorCode::DuplicateEntity);
}

TEST(ErrorIntrospectionTest, EntityNotFoundError_ShouldReturnTrueForIsNotFound) {
    EntityNotFoundError error("missing");
    EXPECT_TRUE(error.is_not_found());
    EXPECT_FALSE(error.is_duplicate());
}

TEST(ErrorIntrospectionTest, InvalidStockRequestError_ShouldReturnTrueForIsInvalidStockRequest) {
    InvalidStockRequestError error("not fancy enough");
    EXPECT_TRUE(error.is_invalid_stock_request());
    EXPECT_FALSE(error.is_failed_transaction());
}

TEST(ErrorIntrospectionTest, FailedTransactionError_ShouldReturnTrueForIsFailedTransaction) {
    FailedTransactionError error("no transaction");
    EXPECT_TRUE(error.is_failed_transaction());
    EXPECT_FALSE(error.is_invalid_stock_request());
}

TEST(ErrorIntrospectionTest, InvalidArgumentError_ShouldReturnTrueForIsInvalidArgument) {
    InvalidArgumentError error("bad input");
    EXPECT_TRUE(error.is_invalid_argument());
}

TEST(ErrorIntrospectionTest, HomesteadError_ShouldHaveDefaultFalseForAllIntrospectionMethods) {
    HomesteadError error("generic error");
    EXPECT_EQ(error.code(), ErrorCode::Unknown);
    EXPECT_FALSE(error.is_duplicate());
    EXPECT_FALSE(error.is_not_found());
    EXPECT_FALSE(error.is_invalid_stock_request());
    EXPECT_FALSE(error.is_failed_transaction());
    EXPECT_FALSE(error.is_invalid_argument());
}

TEST(ErrorIntrospectionTest, DerivedErrors_ShouldBeCatchableAsBase) {
    try {
        throw FailedTransactionError("closed");
    } catch (const HomesteadError& e) {
        EXPECT_TRUE(e.is_failed_transaction());
        EXPECT_STREQ(e.what(), "closed");
    }
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(ValidationTest, RequirePositive_WithZero_ShouldThrowInvalidArgument) {
    EXPECT_THROW(validation::require_positive(0, "Quantity"), InvalidArgumentError);
    EXPECT_NO_THROW(validation::require_positive(1, "Quantity"));
}

TEST(ValidationTest, RequireOngoing_WhenIdle_ShouldThrowFailedTransaction) {
    EXPECT_THROW(validation::require_ongoing(false), FailedTransactionError);
    EXPECT_THROW(validation::require_not_ongoing(true), FailedTransactionError);
}
