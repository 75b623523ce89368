#pragma once

/**
 * Homestead farm-shop library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Helper utilities
#include "helpers.hpp"
#include "logging.hpp"
#include "config.hpp"

// Validation helpers
#include "validation.hpp"

// Stock
#include "product.hpp"
#include "inventory.hpp"

// Customers and sales
#include "customer.hpp"
#include "pricing.hpp"
#include "transaction.hpp"
#include "transaction_manager.hpp"
#include "transaction_history.hpp"
#include "receipt_renderer.hpp"

// Shop front
#include "farm.hpp"
