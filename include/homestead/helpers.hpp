#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/timestamp.pb.h>

namespace homestead {

/**
 * Helper functions shared by receipts and summaries.
 */
namespace helpers {

/**
 * Format integer cents as dollars, e.g. 1234 -> "$12.34", -5 -> "-$0.05".
 */
std::string format_cents(int64_t cents);

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

} // namespace helpers
} // namespace homestead
